#pragma once

#include <any>
#include <functional>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "common/errors.h"

namespace Chronicle {

/**
 * Maps topic strings to typed decoders for item payloads.
 * Register every topic at start-up, then call Validate() with the topics an
 * application expects so an unregistered one fails there rather than deep in
 * a replay.
 */
class TopicRegistry {
public:
    template<typename T>
    using Decoder = std::function<T(const std::string& data)>;

    TopicRegistry() = default;
    ~TopicRegistry() = default;

    template<typename T>
    void RegisterDecoder(const std::string& topic, Decoder<T> decoder) {
        std::lock_guard<std::mutex> lock(mutex_);
        decoders_.insert_or_assign(topic, Entry{std::type_index(typeid(T)), std::move(decoder)});
    }

    bool IsRegistered(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return decoders_.find(topic) != decoders_.end();
    }

    // Throws UnknownTopic, or std::invalid_argument when topic decodes to a
    // type other than T.
    template<typename T>
    T Decode(const std::string& topic, const std::string& data) const {
        Decoder<T> decoder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = decoders_.find(topic);
            if (it == decoders_.end()) {
                throw UnknownTopic(topic);
            }
            if (it->second.type != std::type_index(typeid(T))) {
                throw std::invalid_argument("Topic '" + topic + "' does not decode to the requested type");
            }
            decoder = std::any_cast<Decoder<T>>(it->second.decoder);
        }
        return decoder(data);
    }

    // Throws UnknownTopic naming the first topic without a decoder.
    void Validate(const std::vector<std::string>& topics) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& topic : topics) {
            if (decoders_.find(topic) == decoders_.end()) {
                throw UnknownTopic(topic);
            }
        }
    }

    std::vector<std::string> Topics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> topics;
        topics.reserve(decoders_.size());
        for (const auto& [topic, entry] : decoders_) {
            topics.push_back(topic);
        }
        return topics;
    }

private:
    struct Entry {
        std::type_index type;
        std::any decoder;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> decoders_;
};

} // namespace Chronicle
