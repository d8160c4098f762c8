#include "WamLog.h"

// Verbose mode, off unless the front end enables it
bool g_verbose = false;
