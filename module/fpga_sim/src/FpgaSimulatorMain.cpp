/**
 * @file FpgaSimulatorMain.cpp
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 *
 * @section DESCRIPTION
 *
 * This file provides the "int main()" function to wrap FpgaSimulatorRunner
 * and forward command line arguments to FpgaSimulatorRunner.
 */

#include "FpgaSimulatorRunner.h"
#include "Logger.h"
#include "ThreadNamer.h"


int main(int argc, const char* argv[]) {
    srplink::Logger::initializeWithProcess(srplink::Logger::Process::fpgasim);
    ThreadNamer::SetThisThreadName("FpgaSimMain");
    FpgaSimulatorRunner runner;
    std::atomic<bool> running;
    return (runner.Run(argc, argv, running, true)) ? 0 : 1;
}
