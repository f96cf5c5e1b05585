#pragma once

namespace Relay {

/**
 * Helper macro to generate enum values from a list macro.
 */
#define GENERATE_ENUM(X) X,

/**
 * Construct On First Use idiom.
 * See https://isocpp.org/wiki/faq/ctors#static-init-order-on-first-use.
 */
#define CONSTRUCT_ON_FIRST_USE(type, ...)                                                          \
  do {                                                                                             \
    static const type* objectptr = new type{__VA_ARGS__};                                          \
    return *objectptr;                                                                             \
  } while (0)

} // namespace Relay
