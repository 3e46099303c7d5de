/**
 * @file FpgaSimulatorRunner.h
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
 * This FpgaSimulatorRunner class processes command line args and spins up
 * a single instance of FpgaSimulator within its own process with ctrl-c interrupt support.
 */

#ifndef _FPGA_SIMULATOR_RUNNER_H
#define _FPGA_SIMULATOR_RUNNER_H 1

#include <stdint.h>
#include <string>
#include <atomic>
#include "fpga_sim_lib_export.h"

class FpgaSimulatorRunner {
public:
    FPGA_SIM_LIB_EXPORT FpgaSimulatorRunner();
    FPGA_SIM_LIB_EXPORT ~FpgaSimulatorRunner();

    /** Run the simulator.
     *
     * @param argc The number of command-line arguments.
     * @param argv The array of command-line arguments.
     * @param running The simulation running flag.
     * @param useSignalHandler Whether to activate the signal handler.
     * @return True if the simulation exited cleanly, or False otherwise.
     */
    FPGA_SIM_LIB_EXPORT bool Run(int argc, const char* const argv[], std::atomic<bool>& running, bool useSignalHandler);

    /** Parse an "ADDRESS=VALUE" register assignment (each hex with 0x prefix, or decimal).
     *
     * @return True if both parts parsed and the value fits 32 bits.
     */
    FPGA_SIM_LIB_EXPORT static bool ParseRegisterAssignment(const std::string& assignment, uint64_t& address, uint32_t& value);

private:
    /// Forwards intent to exit by setting m_runningFromSigHandler to False due to exit keypress being caught by the signal handler.
    FPGA_SIM_LIB_NO_EXPORT void MonitorExitKeypressThreadFunction();

    std::atomic<bool> m_runningFromSigHandler;

public:
    uint16_t m_boundLocalPort;
};


#endif //_FPGA_SIMULATOR_RUNNER_H
