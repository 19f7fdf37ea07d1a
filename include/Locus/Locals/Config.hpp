/// @file Config.hpp
/// @brief Compile-time configuration for Locus::Locals. Every macro may be overridden with -D.
#pragma once

// Slot count of a freshly created owner table. Must be a power of two.
#ifndef LOCUS_LOCALS_INITIAL_CAPACITY
#define LOCUS_LOCALS_INITIAL_CAPACITY 16
#endif

// Run OwnerTable::CheckInvariants() after every mutating operation.
#ifndef LOCUS_LOCALS_VALIDATE
#if defined(NDEBUG)
#define LOCUS_LOCALS_VALIDATE 0
#else
#define LOCUS_LOCALS_VALIDATE 1
#endif
#endif

// Write a "[OwnerTable] ..." line to stderr before throwing InvariantViolationException.
#ifndef LOCUS_LOCALS_REPORT_VIOLATIONS
#define LOCUS_LOCALS_REPORT_VIOLATIONS 1
#endif

static_assert(LOCUS_LOCALS_INITIAL_CAPACITY >= 2 && (LOCUS_LOCALS_INITIAL_CAPACITY & (LOCUS_LOCALS_INITIAL_CAPACITY - 1)) == 0,
              "LOCUS_LOCALS_INITIAL_CAPACITY must be a power of two");
