#pragma once

/// @file yadec.hpp
/// @author Aleksandr Loshkarev
/// @brief Main header file for the yadec library.

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "decode_options.hpp"
#include "value.hpp"
#include "tag.hpp"
#include "descriptor.hpp"
#include "reflect.hpp"
#include "descriptor_cache.hpp"
#include "policy.hpp"
#include "json_lexer.hpp"
#include "json_decoder.hpp"
#include "xml_lexer.hpp"
#include "xml_decoder.hpp"
