#ifndef HOSTAUTH_PRIVATE_OUTPUT_H
#define HOSTAUTH_PRIVATE_OUTPUT_H

#include <hostauth/macros.h>

#include <iostream>

HOSTAUTH_PUBLIC extern std::ostream c1out;

HOSTAUTH_PUBLIC bool InitOutput(std::basic_streambuf<char> * const out = std::cout.rdbuf());

#endif
