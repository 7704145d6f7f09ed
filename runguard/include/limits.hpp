#pragma once

#include <sys/resource.h>
#include "runguard_options.hpp"

void set_rlimit(int resource, rlim_t cur, rlim_t max);

/**
 * Limit current process resources usage.
 *
 * Called in the forked child right before exec.
 * Moves the child into its own session so that the
 * whole process tree can be killed with one signal.
 */
void set_restrictions(const struct runguard_options &opt);
