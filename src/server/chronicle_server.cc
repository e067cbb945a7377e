#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "array/big_array.h"
#include "common/configuration.h"
#include "common/sequence_id.h"
#include "log/log_writer.h"
#include "notification/notification_log.h"
#include "notification/notification_log_service.h"
#include "sequencer/counter_service.h"
#include "sequencer/distributed_integer_sequencer.h"
#include "sequencer/local_integer_sequencer.h"
#include "storage/in_memory_record_store.h"

namespace {

std::atomic<bool> g_stop{false};

void HandleSignal(int signal) {
	g_stop = true;
}

std::shared_ptr<Chronicle::IIntegerSequencer> MakeSequencer(
		const Chronicle::ChronicleConfig& config,
		Chronicle::DistributedIntegerSequencer::HighWaterMarkFunc high_water_mark) {
	if (Chronicle::Configuration::getInstance().useDistributedSequencer()) {
		auto counter = std::make_shared<Chronicle::GrpcCounterClient>(
				config.sequencer.counter_address.get(), config.sequencer.counter_name.get(),
				std::chrono::milliseconds(config.server.rpc_deadline_ms.get()));
		auto policy = config.sequencer.resync_on_detection.get()
			? Chronicle::FailoverPolicy::kResyncOnDetection
			: Chronicle::FailoverPolicy::kRelyOnStorageUniqueness;
		LOG(INFO) << "Using distributed sequencer at " << config.sequencer.counter_address.get();
		return std::make_shared<Chronicle::DistributedIntegerSequencer>(
				counter, std::move(high_water_mark), policy);
	}
	return std::make_shared<Chronicle::LocalIntegerSequencer>(high_water_mark());
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("chronicle_server", "Application-wide append-only event log");
	options.allow_unrecognised_options();
	options.add_options()
		("f,config", "YAML configuration file", cxxopts::value<std::string>())
		("a,array-size", "Slots per partition", cxxopts::value<int64_t>())
		("s,section-size", "Notifications per section", cxxopts::value<int64_t>())
		("p,port", "Log service port", cxxopts::value<int>())
		("k,backend", "big_array or record_store", cxxopts::value<std::string>())
		("q,sequencer", "local or distributed", cxxopts::value<std::string>())
		("c,counter-address", "Counter service address", cxxopts::value<std::string>())
		("no_counter_service", "Do not host the counter service in this process")
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Chronicle::Configuration& configuration = Chronicle::Configuration::getInstance();
	configuration.overrideFromCommandLine(argc, argv);
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return EXIT_FAILURE;
	}
	const Chronicle::ChronicleConfig& config = configuration.config();

	Chronicle::RetryPolicy retry;
	retry.max_attempts = config.retry.max_attempts.get();
	retry.wait = std::chrono::milliseconds(config.retry.wait_ms.get());

	const std::string address = config.server.address.get();
	const Chronicle::SequenceId application_id =
		Chronicle::ParseSequenceId(config.log.application_id.get());

	try {
		// *************** Counter service **********************
		std::unique_ptr<Chronicle::CounterServer> counter_server;
		if (!arguments.count("no_counter_service")) {
			counter_server = std::make_unique<Chronicle::CounterServer>(
					address, config.server.counter_port.get());
		}

		// *************** Log **********************
		auto store = std::make_shared<Chronicle::InMemoryRecordStore>();
		std::shared_ptr<Chronicle::INotificationLog> log;
		std::shared_ptr<Chronicle::ILogWriter> writer;

		if (configuration.useBigArrayBackend()) {
			auto array = std::make_shared<Chronicle::BigArray>(
					application_id, store, configuration.getArraySize());
			auto sequencer = MakeSequencer(config, [array]() { return array->GetNextPosition(); });
			writer = std::make_shared<Chronicle::SequencedAppender>(array, sequencer, retry);
			log = std::make_shared<Chronicle::BigArrayNotificationLog>(
					array, configuration.getSectionSize());
		} else {
			std::shared_ptr<Chronicle::IIntegerSequencer> sequencer;
			if (configuration.useDistributedSequencer()) {
				sequencer = MakeSequencer(config, [store, application_id]() {
						return Chronicle::NextUnassignedPosition(*store, application_id);
						});
			}
			// Without a sequencer the store computes max + 1 atomically.
			writer = std::make_shared<Chronicle::RecordStoreAppender>(
					store, application_id, sequencer, retry);
			log = std::make_shared<Chronicle::RecordStoreNotificationLog>(
					store, application_id, configuration.getSectionSize());
		}

		Chronicle::NotificationLogServiceImpl log_service(
				log, config.notification.archived_max_age_seconds.get());
		Chronicle::LogWriterServiceImpl writer_service(writer);
		Chronicle::LogServer server(address, configuration.getServerPort(),
				{&log_service, &writer_service});

		LOG(INFO) << "Chronicle initialized. Backend " << config.log.backend.get()
			<< ", sequencer " << config.sequencer.mode.get()
			<< ", application " << Chronicle::SequenceIdToString(application_id);

		// *************** Wait for a shutdown signal **********************
		std::signal(SIGINT, HandleSignal);
		std::signal(SIGTERM, HandleSignal);
		while (!g_stop) {
			std::this_thread::sleep_for(std::chrono::milliseconds(200));
		}

		LOG(INFO) << "Received shutdown signal";
		server.Shutdown();
		if (counter_server) {
			counter_server->Shutdown();
		}
	} catch (const std::exception& e) {
		LOG(ERROR) << "Chronicle server failed: " << e.what();
		return EXIT_FAILURE;
	}

	LOG(INFO) << "Chronicle Terminating";
	return EXIT_SUCCESS;
}
