#pragma once

#include <gtest/gtest.h>

// Dispatches to standard gtest main function, while adding LoggingUtil cmdline params
int launch_gtest(int argc, char** argv);
