#pragma once

// Core value model
#include "vcodec/core/exception.hpp"
#include "vcodec/core/extended_types.hpp"
#include "vcodec/core/value.hpp"
#include "vcodec/core/type_descriptor.hpp"
#include "vcodec/core/session_timezone.hpp"

// Codecs
#include "vcodec/core/scalar_codec.hpp"
#include "vcodec/core/interval_codec.hpp"
#include "vcodec/core/complex_literal_parser.hpp"
#include "vcodec/core/value_decoder.hpp"
#include "vcodec/core/literal_encoder.hpp"
#include "vcodec/core/codec.hpp"

// Native type adapters (ttmath adapter is opt-in: include vcodec/adapters/ttmath_numeric.hpp)
#include "vcodec/core/type_adapter.hpp"
#include "vcodec/adapters/chrono_datetime.hpp"
