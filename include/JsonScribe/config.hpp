#pragma once

#include <cstddef>

// Size of the scratch buffer used to render integers and floating point values.
#ifndef JSONSCRIBE_NUMBER_BUF_SIZE
#define JSONSCRIBE_NUMBER_BUF_SIZE 64
#endif

// Capacity of DefaultContextStack, i.e. how deep arrays/objects/string values may nest.
#ifndef JSONSCRIBE_DEFAULT_MAX_DEPTH
#define JSONSCRIBE_DEFAULT_MAX_DEPTH 512
#endif

namespace JsonScribe {

constexpr std::size_t NumberBufSize = JSONSCRIBE_NUMBER_BUF_SIZE;
constexpr std::size_t DefaultMaxDepth = JSONSCRIBE_DEFAULT_MAX_DEPTH;

static_assert(NumberBufSize >= 32, "[[[ JsonScribe ]]] JSONSCRIBE_NUMBER_BUF_SIZE is too small for 64-bit numbers");
static_assert(DefaultMaxDepth > 0, "[[[ JsonScribe ]]] JSONSCRIBE_DEFAULT_MAX_DEPTH must be positive");

} // namespace JsonScribe
