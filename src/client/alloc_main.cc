#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"

// Project includes
#include "allocator/id_allocator.h"
#include "common/config.h"
#include "common/configuration.h"
#include "common/stopper.h"
#include "kv/remote_counter_store.h"

namespace {

// Returns the number of duplicated IDs in ids. Sorts ids.
size_t CountDuplicates(std::vector<int64_t>& ids) {
	std::sort(ids.begin(), ids.end());
	size_t duplicates = 0;
	for (size_t i = 1; i < ids.size(); ++i) {
		if (ids[i] == ids[i - 1]) {
			duplicates++;
		}
	}
	return duplicates;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("tessera_alloc", "Allocate IDs from a remote Tessera counter");
	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("s,server", "Counter server address", cxxopts::value<std::string>())
		("k,key", "Counter key of the ID class", cxxopts::value<std::string>())
		("n,count", "Number of IDs to allocate", cxxopts::value<int>()->default_value("100"))
		("t,threads", "Number of allocating threads", cxxopts::value<int>()->default_value("4"))
		("min_id", "Smallest ID handed out", cxxopts::value<int64_t>())
		("block_size", "IDs reserved per counter increment", cxxopts::value<int64_t>())
		("print", "Print every allocated ID")
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
	auto& config = configuration.config();
	if (arguments.count("server")) config.client.server_address.set(arguments["server"].as<std::string>());
	if (arguments.count("key")) config.allocator.id_key.set(arguments["key"].as<std::string>());
	if (arguments.count("min_id")) config.allocator.min_id.set(arguments["min_id"].as<int64_t>());
	if (arguments.count("block_size")) config.allocator.block_size.set(arguments["block_size"].as<int64_t>());
	if (!configuration.validate()) {
		return EXIT_FAILURE;
	}

	const int count = arguments["count"].as<int>();
	const int num_threads = arguments["threads"].as<int>();
	if (count < 0 || num_threads < 1) {
		LOG(ERROR) << "count must be non-negative and threads at least 1";
		return EXIT_FAILURE;
	}

	auto store = std::make_shared<Tessera::RemoteCounterStore>(
			configuration.getServerAddress(),
			absl::Milliseconds(config.client.rpc_timeout_ms.get()));

	Tessera::Stopper stopper;
	auto id_alloc = Tessera::IdAllocator::Create(
			configuration.getIdKey(), store,
			configuration.getMinId(), configuration.getBlockSize(), &stopper,
			Tessera::RetryOptions::FromConfig(config));
	if (!id_alloc.ok()) {
		LOG(ERROR) << "Failed to create IdAllocator: " << id_alloc.status();
		return EXIT_FAILURE;
	}

	LOG(INFO) << "Allocating " << count << " IDs from " << configuration.getServerAddress()
		<< " key=" << configuration.getIdKey() << " with " << num_threads << " threads";

	absl::Mutex mu;
	std::vector<int64_t> allocated;
	bool failed = false;
	allocated.reserve(count);

	absl::Time start = absl::Now();
	std::vector<std::thread> threads;
	for (int t = 0; t < num_threads; ++t) {
		int share = count / num_threads + (t < count % num_threads ? 1 : 0);
		threads.emplace_back([&, share]() {
				for (int i = 0; i < share; ++i) {
					absl::StatusOr<int64_t> id = (*id_alloc)->Allocate();
					absl::MutexLock lock(&mu);
					if (!id.ok()) {
						LOG(ERROR) << "Allocate failed: " << id.status();
						failed = true;
						return;
					}
					allocated.push_back(*id);
				}
				});
	}
	for (auto& thread : threads) {
		thread.join();
	}
	absl::Duration elapsed = absl::Now() - start;

	// Allocator first: it unregisters from the stopper on destruction.
	id_alloc->reset();
	stopper.Stop();

	if (arguments.count("print")) {
		std::vector<int64_t> in_order = allocated;
		std::sort(in_order.begin(), in_order.end());
		for (int64_t id : in_order) {
			std::cout << id << "\n";
		}
	}

	size_t duplicates = CountDuplicates(allocated);
	if (!allocated.empty()) {
		LOG(INFO) << "Allocated " << allocated.size() << " IDs in [" << allocated.front() << ", "
			<< allocated.back() << "] in " << elapsed;
	}
	if (duplicates > 0) {
		LOG(ERROR) << duplicates << " duplicate IDs";
		return EXIT_FAILURE;
	}
	return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
