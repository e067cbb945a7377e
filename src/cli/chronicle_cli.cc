#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"

// Project includes
#include "common/config.h"
#include "common/errors.h"
#include "common/topic_registry.h"
#include "notification/notification_reader.h"
#include "notification/remote_notification_log.h"
#include "notification/section_codec.h"

namespace {

// Topics this tool knows how to print.
void RegisterBuiltinTopics(Chronicle::TopicRegistry& registry) {
	registry.RegisterDecoder<std::string>("text", [](const std::string& data) { return data; });
	registry.RegisterDecoder<std::string>("int64", [](const std::string& data) {
			int64_t value = 0;
			if (!absl::SimpleAtoi(data, &value)) {
				throw std::invalid_argument("Not an integer: " + data);
			}
			return std::to_string(value);
			});
}

int64_t LoadPosition(const std::string& path) {
	std::ifstream in(path);
	int64_t position = 0;
	if (in && !(in >> position)) {
		throw std::runtime_error("Corrupt position file " + path);
	}
	return position;
}

void SavePosition(const std::string& path, int64_t position) {
	const std::string tmp = path + ".tmp";
	{
		std::ofstream out(tmp, std::ios::trunc);
		out << position << "\n";
		if (!out) {
			throw std::runtime_error("Failed to write position file " + tmp);
		}
	}
	if (std::rename(tmp.c_str(), path.c_str()) != 0) {
		throw std::runtime_error("Failed to replace position file " + path);
	}
}

int RunAppend(const cxxopts::ParseResult& arguments, const std::string& server,
		std::chrono::milliseconds deadline) {
	Chronicle::RemoteLogWriter writer(server, deadline);
	const std::string topic = arguments["topic"].as<std::string>();

	if (arguments.count("data")) {
		std::cout << writer.Append(topic, arguments["data"].as<std::string>()) << std::endl;
		return EXIT_SUCCESS;
	}
	// One item per line of stdin
	std::string line;
	while (std::getline(std::cin, line)) {
		std::cout << writer.Append(topic, line) << std::endl;
	}
	return EXIT_SUCCESS;
}

int RunSection(const cxxopts::ParseResult& arguments, const std::string& server,
		std::chrono::milliseconds deadline) {
	Chronicle::RemoteNotificationLog log(server, deadline);
	std::cout << Chronicle::SectionToJson(log.GetSection(arguments["section"].as<std::string>()))
		<< std::endl;
	return EXIT_SUCCESS;
}

int RunFollow(const cxxopts::ParseResult& arguments, const std::string& server,
		std::chrono::milliseconds deadline) {
	Chronicle::TopicRegistry registry;
	RegisterBuiltinTopics(registry);
	if (arguments.count("expect_topics")) {
		std::vector<std::string> expected =
			absl::StrSplit(arguments["expect_topics"].as<std::string>(), ',', absl::SkipEmpty());
		registry.Validate(expected);
	}
	const bool strict = arguments.count("strict") > 0;

	Chronicle::ReaderOptions reader_options;
	const std::string gaps = arguments["gaps"].as<std::string>();
	if (gaps == "skip") {
		reader_options.gap_policy = Chronicle::GapPolicy::kSkip;
	} else if (gaps == "wait") {
		reader_options.gap_policy = Chronicle::GapPolicy::kWait;
	} else if (gaps != "surface") {
		LOG(ERROR) << "Unknown gap policy: " << gaps;
		return EXIT_FAILURE;
	}

	auto log = std::make_shared<Chronicle::RemoteNotificationLog>(server, deadline);
	Chronicle::NotificationReader reader(log, reader_options);

	const std::string position_file =
		arguments.count("position_file") ? arguments["position_file"].as<std::string>() : "";
	if (!position_file.empty()) {
		reader.Seek(LoadPosition(position_file));
	}
	LOG(INFO) << "Following " << server << " from position " << reader.position();

	const auto poll = std::chrono::milliseconds(arguments["poll_ms"].as<int>());
	const bool once = arguments.count("once") > 0;
	while (true) {
		std::vector<Chronicle::NotificationSlot> items = reader.Read();
		for (const auto& item : items) {
			if (!item) {
				std::cout << "-\t(gap)" << std::endl;
				continue;
			}
			if (registry.IsRegistered(item->topic)) {
				std::cout << item->id << "\t" << item->topic << "\t"
					<< registry.Decode<std::string>(item->topic, item->data) << std::endl;
			} else if (strict) {
				throw Chronicle::UnknownTopic(item->topic);
			} else {
				std::cout << item->id << "\t" << item->topic << "\t<" << item->data.size()
					<< " bytes>" << std::endl;
			}
		}
		if (!position_file.empty() && !items.empty()) {
			SavePosition(position_file, reader.position());
		}
		VLOG(1) << "Read " << items.size() << " notifications from " << reader.section_count()
			<< " sections";
		if (once) {
			break;
		}
		std::this_thread::sleep_for(poll);
	}
	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("chronicle_cli", "Append to and follow a Chronicle log");
	options.add_options()
		("mode", "append, follow or section", cxxopts::value<std::string>())
		("server", "Log server address",
		 cxxopts::value<std::string>()->default_value("127.0.0.1:" + std::to_string(Chronicle::kDefaultServerPort)))
		("deadline_ms", "Per-call deadline",
		 cxxopts::value<int>()->default_value(std::to_string(Chronicle::kDefaultRpcDeadlineMs)))
		("t,topic", "Topic for append", cxxopts::value<std::string>()->default_value("text"))
		("d,data", "Payload for append (default: one item per stdin line)", cxxopts::value<std::string>())
		("section", "Section id for section mode",
		 cxxopts::value<std::string>()->default_value(Chronicle::kCurrentSectionId))
		("position_file", "Where follow keeps its position", cxxopts::value<std::string>())
		("expect_topics", "Comma-separated topics that must have decoders", cxxopts::value<std::string>())
		("strict", "Fail on topics without a decoder")
		("gaps", "surface, skip or wait", cxxopts::value<std::string>()->default_value("surface"))
		("poll_ms", "Follow poll interval", cxxopts::value<int>()->default_value("500"))
		("once", "Read what is available and exit")
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");
	options.parse_positional({"mode"});

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help") || !arguments.count("mode")) {
		std::cout << options.help() << std::endl;
		return arguments.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	const std::string mode = arguments["mode"].as<std::string>();
	const std::string server = arguments["server"].as<std::string>();
	const auto deadline = std::chrono::milliseconds(arguments["deadline_ms"].as<int>());

	try {
		if (mode == "append") {
			return RunAppend(arguments, server, deadline);
		} else if (mode == "follow") {
			return RunFollow(arguments, server, deadline);
		} else if (mode == "section") {
			return RunSection(arguments, server, deadline);
		}
		LOG(ERROR) << "Unknown mode: " << mode;
	} catch (const std::exception& e) {
		LOG(ERROR) << mode << " failed: " << e.what();
	}
	return EXIT_FAILURE;
}
