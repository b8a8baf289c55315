#include "arch/misc.hpp"

bool IRQS_ENABLED = true;
