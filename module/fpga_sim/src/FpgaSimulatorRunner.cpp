/**
 * @file FpgaSimulatorRunner.cpp
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include "FpgaSimulator.h"
#include "FpgaSimulatorRunner.h"
#include "AxiVersionDevice.h"
#include "SignalHandler.h"
#include "Logger.h"

#include <cstdlib>
#include <cerrno>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/bind/bind.hpp>
#include <boost/date_time.hpp>


static constexpr srplink::Logger::SubProcess subprocess = srplink::Logger::SubProcess::fpgasim;

void FpgaSimulatorRunner::MonitorExitKeypressThreadFunction() {
    LOG_INFO(subprocess) << "Keyboard Interrupt.. exiting";
    m_runningFromSigHandler = false;
}


FpgaSimulatorRunner::FpgaSimulatorRunner() : m_runningFromSigHandler(false), m_boundLocalPort(0) {}
FpgaSimulatorRunner::~FpgaSimulatorRunner() {}

static bool ParseUnsigned(const std::string& str, uint64_t& value) {
    if (str.empty()) {
        return false;
    }
    char* end = NULL;
    errno = 0;
    const unsigned long long v = strtoull(str.c_str(), &end, 0); //base 0 accepts 0x prefixed hex
    if ((errno != 0) || (end == NULL) || (*end != '\0') || (str[0] == '-')) {
        return false;
    }
    value = static_cast<uint64_t>(v);
    return true;
}

bool FpgaSimulatorRunner::ParseRegisterAssignment(const std::string& assignment, uint64_t& address, uint32_t& value) {
    const std::size_t equalsPos = assignment.find('=');
    if (equalsPos == std::string::npos) {
        return false;
    }
    uint64_t value64;
    if ((!ParseUnsigned(assignment.substr(0, equalsPos), address)) || (!ParseUnsigned(assignment.substr(equalsPos + 1), value64))) {
        return false;
    }
    if (value64 > UINT32_MAX) {
        return false;
    }
    value = static_cast<uint32_t>(value64);
    return true;
}

bool FpgaSimulatorRunner::Run(int argc, const char* const argv[], std::atomic<bool>& running, bool useSignalHandler) {
    //scope to ensure clean exit before return 0
    {
        running = true;
        m_runningFromSigHandler = true;
        SignalHandler sigHandler(boost::bind(&FpgaSimulatorRunner::MonitorExitKeypressThreadFunction, this));

        RssiConfig_ptr rssiConfigPtr;
        uint16_t myBoundUdpPort;
        std::vector<std::pair<uint64_t, uint32_t> > initialRegisters;

        boost::program_options::options_description desc("Allowed options");
        try {
            desc.add_options()
                ("help", "Produce help message.")
                ("rssi-config-file", boost::program_options::value<boost::filesystem::path>(), "RSSI synchronization parameters JSON file (default: built-in defaults).")
                ("my-bound-udp-port", boost::program_options::value<uint16_t>()->default_value(RssiConnection::DEFAULT_REMOTE_UDP_PORT), "My bound UDP port (to listen on).")
                ("register", boost::program_options::value<std::vector<std::string> >()->multitoken()->composing(), "Initial register value ADDRESS=VALUE (hex with 0x prefix or decimal, repeatable).")
                ("version-register-value", boost::program_options::value<uint32_t>()->default_value(0), "Initial value of the AxiVersion firmware version register (address 0).")
                ;

            boost::program_options::variables_map vm;
            boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc, boost::program_options::command_line_style::unix_style | boost::program_options::command_line_style::case_insensitive), vm);
            boost::program_options::notify(vm);

            if (vm.count("help")) {
                LOG_INFO(subprocess) << desc;
                return false;
            }

            if (vm.count("rssi-config-file")) {
                const boost::filesystem::path configFilePath = vm["rssi-config-file"].as<boost::filesystem::path>();
                rssiConfigPtr = RssiConfig::CreateFromJsonFilePath(configFilePath);
                if (!rssiConfigPtr) {
                    LOG_ERROR(subprocess) << "error loading RSSI config file: " << configFilePath;
                    return false;
                }
            }
            else {
                rssiConfigPtr = std::make_shared<RssiConfig>();
            }
            myBoundUdpPort = vm["my-bound-udp-port"].as<uint16_t>();
            initialRegisters.emplace_back(AxiVersionDevice::FPGA_VERSION_OFFSET, vm["version-register-value"].as<uint32_t>());
            if (vm.count("register")) {
                const std::vector<std::string> assignments = vm["register"].as<std::vector<std::string> >();
                for (std::size_t i = 0; i < assignments.size(); ++i) {
                    uint64_t address;
                    uint32_t value;
                    if (!ParseRegisterAssignment(assignments[i], address, value)) {
                        LOG_ERROR(subprocess) << "invalid register assignment: " << assignments[i];
                        return false;
                    }
                    initialRegisters.emplace_back(address, value);
                }
            }
        }
        catch (boost::bad_any_cast & e) {
            LOG_ERROR(subprocess) << "invalid data error: " << e.what() << "\n";
            LOG_ERROR(subprocess) << desc;
            return false;
        }
        catch (std::exception& e) {
            LOG_ERROR(subprocess) << e.what();
            return false;
        }

        LOG_INFO(subprocess) << "starting FpgaSimulator..";
        FpgaSimulator fpgaSimulator(*rssiConfigPtr);
        for (std::size_t i = 0; i < initialRegisters.size(); ++i) {
            fpgaSimulator.SetRegister(initialRegisters[i].first, initialRegisters[i].second);
        }
        if (!fpgaSimulator.Start(myBoundUdpPort)) {
            return false;
        }
        m_boundLocalPort = fpgaSimulator.GetBoundLocalPort();

        if (useSignalHandler) {
            sigHandler.Start(false);
        }
        LOG_INFO(subprocess) << "FpgaSimulator up and running";
        while (running && m_runningFromSigHandler) {
            boost::this_thread::sleep(boost::posix_time::millisec(250));
            if (useSignalHandler) {
                sigHandler.PollOnce();
            }
        }
        fpgaSimulator.Stop();
    }
    LOG_INFO(subprocess) << "FpgaSimulator: exited cleanly";
    return true;
}
