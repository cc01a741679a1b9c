#pragma once

#ifndef CLIMATIME_VERSION
  #define CLIMATIME_VERSION "0.1.0"
#endif

/// Macro alias for trailing return type functions.
#define fn auto
