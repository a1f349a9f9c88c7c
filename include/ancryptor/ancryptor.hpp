#pragma once

// Main public API - include all headers
#include "ancryptor/ancryptor_constants.hpp"
#include "ancryptor/text_codec.hpp"

namespace ancryptor {}
