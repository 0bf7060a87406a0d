// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Macros Header - attributes used in the libhostauth interface, the
   library version and the DEFER scope guard

   ##################################################################### */
									/*}}}*/
// Private header
#ifndef HOSTAUTH_MACROS_H
#define HOSTAUTH_MACROS_H

#ifdef __GNUC__
	#define HOSTAUTH_PURE	__attribute__((pure))
	#define HOSTAUTH_PRINTF(n)	__attribute__((format(printf, n, n + 1)))
	#define HOSTAUTH_UNUSED	__attribute__((unused))
	#define HOSTAUTH_COLD	__attribute__((cold))
	#define HOSTAUTH_PUBLIC	__attribute__((visibility("default")))
	#define HOSTAUTH_HIDDEN	__attribute__((visibility("hidden")))
#else
	#define HOSTAUTH_PURE
	#define HOSTAUTH_PRINTF(n)
	#define HOSTAUTH_UNUSED
	#define HOSTAUTH_COLD
	#define HOSTAUTH_PUBLIC
	#define HOSTAUTH_HIDDEN
#endif

// Changing MAJOR or MINOR changes the SONAME of libhostauth
#define HOSTAUTH_MAJOR 1
#define HOSTAUTH_MINOR 0
#define HOSTAUTH_RELEASE 0

/* DEFER([] { cleanup(); }); runs the lambda when the scope is left */
template <class F>
struct HostAuthScopeWrapper {
   F func;
   ~HostAuthScopeWrapper() { func(); }
};
template <class F>
HostAuthScopeWrapper(F) -> HostAuthScopeWrapper<F>;
#define HOSTAUTH_PASTE2(a, b) a##b
#define HOSTAUTH_PASTE(a, b) HOSTAUTH_PASTE2(a, b)
#define DEFER(lambda) HostAuthScopeWrapper HOSTAUTH_PASTE(defer, __LINE__){lambda};

#endif
