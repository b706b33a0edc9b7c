#include "SanitizerLogic.h"
#include <string>

// Replacement used when neither the command line nor the configuration file supplies one
const std::string SanitizerLogic::DefaultReplacement = "_";
