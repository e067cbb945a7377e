#pragma once

#include <string>

#include "notification/notification.h"
#include "notification_log.pb.h"

namespace Chronicle {

void ToProto(const CausalDependency& dependency, chronicle::log::CausalDependency* proto);
CausalDependency FromProto(const chronicle::log::CausalDependency& proto);

void ToProto(const NotificationSection& section, chronicle::log::NotificationSection* proto);
NotificationSection FromProto(const chronicle::log::NotificationSection& proto);

// Self-describing JSON document (protobuf JSON mapping).
std::string SectionToJson(const NotificationSection& section);
// Throws std::invalid_argument on malformed JSON.
NotificationSection SectionFromJson(const std::string& json);

// Changes whenever the section's visible content changes.
std::string ComputeETag(const NotificationSection& section);

} // namespace Chronicle
