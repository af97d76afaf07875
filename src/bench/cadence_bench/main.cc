#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "glog/logging.h"
#include "cxxopts.hpp"

#include "common/configuration.h"
#include "dispatcher/sequence_manager.h"
#include "executor/thread_pool_executor.h"

using namespace Cadence;

namespace {

// Keyed event: carries its position in its key's stream
class OrderedEvent : public Event {
	public:
		OrderedEvent(int64_t key, int64_t seq) : key_(key), seq_(seq) {}
		int64_t key() const { return key_; }
		int64_t seq() const { return seq_; }
	private:
		int64_t key_;
		int64_t seq_;
};

class UnorderedEvent : public Event {};

class BenchPolicy : public SequencingPolicy {
	public:
		std::optional<SequenceKey> GetSequenceKeyFor(const Event& event) const override {
			const auto* ordered = dynamic_cast<const OrderedEvent*>(&event);
			if (ordered == nullptr) {
				return std::nullopt;
			}
			return SequenceKey(ordered->key());
		}
};

// Checks per-key order and exclusivity while counting deliveries
class VerifyingListener : public EventListener {
	public:
		VerifyingListener(size_t num_keys, int handler_delay_us)
			: last_seq_(num_keys), in_flight_(num_keys), handler_delay_us_(handler_delay_us) {
			for (auto& s : last_seq_) s.store(-1);
			for (auto& f : in_flight_) f.store(false);
		}

		bool CanHandle(std::type_index type) const override {
			return type == std::type_index(typeid(OrderedEvent)) ||
				type == std::type_index(typeid(UnorderedEvent));
		}

		void Handle(const Event& event) override {
			if (handler_delay_us_ > 0) {
				std::this_thread::sleep_for(std::chrono::microseconds(handler_delay_us_));
			}
			const auto* ordered = dynamic_cast<const OrderedEvent*>(&event);
			if (ordered == nullptr) {
				unordered_handled_.fetch_add(1, std::memory_order_relaxed);
				return;
			}
			const size_t k = static_cast<size_t>(ordered->key());
			if (in_flight_[k].exchange(true)) {
				overlaps_.fetch_add(1, std::memory_order_relaxed);
			}
			const int64_t previous = last_seq_[k].exchange(ordered->seq());
			if (previous + 1 != ordered->seq()) {
				order_violations_.fetch_add(1, std::memory_order_relaxed);
				LOG_FIRST_N(ERROR, 10) << "Key " << k << " expected seq " << previous + 1
					<< " got " << ordered->seq();
			}
			in_flight_[k].store(false);
			ordered_handled_.fetch_add(1, std::memory_order_relaxed);
		}

		std::shared_ptr<SequencingPolicy> GetSequencingPolicy() const override {
			return std::make_shared<BenchPolicy>();
		}

		uint64_t ordered_handled() const { return ordered_handled_.load(); }
		uint64_t unordered_handled() const { return unordered_handled_.load(); }
		uint64_t order_violations() const { return order_violations_.load(); }
		uint64_t overlaps() const { return overlaps_.load(); }

	private:
		std::vector<std::atomic<int64_t>> last_seq_;
		std::vector<std::atomic<bool>> in_flight_;
		const int handler_delay_us_;
		std::atomic<uint64_t> ordered_handled_{0};
		std::atomic<uint64_t> unordered_handled_{0};
		std::atomic<uint64_t> order_violations_{0};
		std::atomic<uint64_t> overlaps_{0};
};

} // end of namespace

int main(int argc, char** argv) {
	google::InitGoogleLogging(argv[0]);
	FLAGS_logtostderr = 1;

	cxxopts::Options options("cadence_bench", "Sequence-aware dispatcher load generator");
	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("producers", "Producer threads", cxxopts::value<int>()->default_value("4"))
		("workers", "Executor threads (overrides configuration)", cxxopts::value<int>())
		("keys", "Distinct sequence keys", cxxopts::value<int>()->default_value("64"))
		("events", "Events per producer", cxxopts::value<int>()->default_value("100000"))
		("unordered_ratio", "0.0..1.0 fraction of events without a sequence key", cxxopts::value<double>()->default_value("0.1"))
		("handler_delay_us", "Simulated handler work in microseconds", cxxopts::value<int>()->default_value("0"))
		("max_events_per_drain", "Drain batch before yielding (overrides configuration)", cxxopts::value<size_t>())
		("seed", "PRNG seed", cxxopts::value<uint64_t>()->default_value("1"))
		("l,log_level", "Log level", cxxopts::value<int>())
		("help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	Configuration& configuration = Configuration::getInstance();
	if (arguments.count("config") && !configuration.loadFromFile(arguments["config"].as<std::string>())) {
		return EXIT_FAILURE;
	}
	if (arguments.count("workers")) {
		configuration.config().executor.num_threads.set(arguments["workers"].as<int>());
	}
	if (arguments.count("max_events_per_drain")) {
		configuration.config().scheduler.max_events_per_drain.set(arguments["max_events_per_drain"].as<size_t>());
	}
	if (arguments.count("log_level")) {
		configuration.config().logging.verbosity.set(arguments["log_level"].as<int>());
	}
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}
	FLAGS_v = configuration.getLogVerbosity();

	const int producers = arguments["producers"].as<int>();
	const int num_keys = arguments["keys"].as<int>();
	const int events_per_producer = arguments["events"].as<int>();
	const double unordered_ratio = arguments["unordered_ratio"].as<double>();
	const int handler_delay_us = arguments["handler_delay_us"].as<int>();
	const uint64_t seed = arguments["seed"].as<uint64_t>();

	if (producers < 1 || num_keys < producers || events_per_producer < 0) {
		LOG(ERROR) << "Need at least one producer and at least as many keys as producers";
		return EXIT_FAILURE;
	}

	LOG(INFO) << "Config: producers=" << producers
		<< " workers=" << configuration.getExecutorThreads()
		<< " keys=" << num_keys
		<< " events_per_producer=" << events_per_producer
		<< " unordered_ratio=" << unordered_ratio
		<< " handler_delay_us=" << handler_delay_us
		<< " max_events_per_drain=" << configuration.getMaxEventsPerDrain();

	auto listener = std::make_shared<VerifyingListener>(static_cast<size_t>(num_keys), handler_delay_us);
	ThreadPoolExecutor executor(static_cast<size_t>(configuration.getExecutorThreads()));

	SequenceManagerOptions manager_options;
	manager_options.scheduler.max_events_per_drain = configuration.getMaxEventsPerDrain();
	SequenceManager manager(listener, executor, manager_options);

	std::atomic<uint64_t> ordered_published{0};
	std::atomic<uint64_t> unordered_published{0};

	const auto start = std::chrono::steady_clock::now();
	std::vector<std::thread> threads;
	for (int p = 0; p < producers; ++p) {
		threads.emplace_back([&, p]() {
			// Each producer owns the keys congruent to p, so per-key order is its own
			std::mt19937_64 rng(seed + static_cast<uint64_t>(p));
			std::uniform_real_distribution<double> coin(0.0, 1.0);
			std::vector<int64_t> next_seq(static_cast<size_t>(num_keys), 0);
			int64_t key = p;
			for (int i = 0; i < events_per_producer; ++i) {
				if (coin(rng) < unordered_ratio) {
					manager.AddEvent(std::make_shared<UnorderedEvent>());
					unordered_published.fetch_add(1, std::memory_order_relaxed);
					continue;
				}
				manager.AddEvent(std::make_shared<OrderedEvent>(key, next_seq[static_cast<size_t>(key)]++));
				ordered_published.fetch_add(1, std::memory_order_relaxed);
				key += producers;
				if (key >= num_keys) key = p;
			}
		});
	}
	for (auto& t : threads) {
		t.join();
	}
	const auto published = std::chrono::steady_clock::now();

	executor.Stop();
	const auto end = std::chrono::steady_clock::now();

	const double publish_s = std::chrono::duration<double>(published - start).count();
	const double total_s = std::chrono::duration<double>(end - start).count();
	const uint64_t total = ordered_published.load() + unordered_published.load();
	const auto stats = manager.GetStats();

	std::cout << "Published " << total << " events in " << publish_s << " s ("
		<< (publish_s > 0 ? total / publish_s : 0) << " ev/s)" << std::endl;
	std::cout << "Handled all events in " << total_s << " s ("
		<< (total_s > 0 ? total / total_s : 0) << " ev/s)" << std::endl;
	std::cout << "Schedulers created: " << stats.schedulers_created
		<< ", registration retries: " << stats.registration_retries
		<< ", still active: " << manager.ActiveSequenceCount() << std::endl;

	bool ok = true;
	if (listener->ordered_handled() != ordered_published.load() ||
			listener->unordered_handled() != unordered_published.load()) {
		LOG(ERROR) << "Delivery mismatch: ordered " << listener->ordered_handled() << "/" << ordered_published.load()
			<< " unordered " << listener->unordered_handled() << "/" << unordered_published.load();
		ok = false;
	}
	if (listener->order_violations() > 0 || listener->overlaps() > 0) {
		LOG(ERROR) << "Sequencing broken: " << listener->order_violations() << " order violations, "
			<< listener->overlaps() << " overlapping handler calls";
		ok = false;
	}
	std::cout << (ok ? "Verification passed" : "Verification FAILED") << std::endl;
	return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
