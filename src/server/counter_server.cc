#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <pthread.h>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/config.h"
#include "common/configuration.h"
#include "kv/counter_service.h"
#include "kv/sharded_counter_store.h"

namespace {

// Blocks SIGINT and SIGTERM for this thread and every thread created after
// it, so that only WaitForShutdownSignal() receives them.
sigset_t BlockShutdownSignals() {
	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);
	pthread_sigmask(SIG_BLOCK, &signals, nullptr);
	return signals;
}

int WaitForShutdownSignal(const sigset_t& signals) {
	int signal = 0;
	if (sigwait(&signals, &signal) != 0) {
		LOG(ERROR) << "sigwait failed";
		return -1;
	}
	return signal;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("tessera_counter_server", "Linearizable counter store for Tessera ID allocation");
	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("p,port", "Listening port (overrides configuration)", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	Tessera::Configuration& configuration = Tessera::Configuration::getInstance();
	if (arguments.count("config") &&
			!configuration.loadFromFile(arguments["config"].as<std::string>())) {
		LOG(ERROR) << "Invalid configuration file " << arguments["config"].as<std::string>();
		return EXIT_FAILURE;
	}
	if (arguments.count("port")) {
		configuration.config().server.port.set(arguments["port"].as<int>());
	}
	if (!configuration.validate()) {
		return EXIT_FAILURE;
	}

	const sigset_t signals = BlockShutdownSignals();

	const auto& server_config = configuration.config().server;
	const std::string server_address = server_config.address.get() + ":" +
		std::to_string(server_config.port.get());

	auto store = std::make_shared<Tessera::ShardedCounterStore>();
	Tessera::CounterServiceImpl service(store);
	std::unique_ptr<grpc::Server> server = Tessera::StartCounterServer(server_address, &service);
	if (!server) {
		return EXIT_FAILURE;
	}

	// *************** Wait for a shutdown signal **********************
	int signal = WaitForShutdownSignal(signals);
	LOG(INFO) << "Received shutdown signal " << signal;

	server->Shutdown();
	server->Wait();

	LOG(INFO) << "Counter server terminating";
	return EXIT_SUCCESS;
}
