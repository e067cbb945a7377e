#include "section_codec.h"

#include <stdexcept>

#include <google/protobuf/util/json_util.h>

#include "absl/strings/str_cat.h"

namespace Chronicle {

void ToProto(const CausalDependency& dependency, chronicle::log::CausalDependency* proto) {
    proto->set_log_id(dependency.log_id);
    proto->set_notification_id(dependency.notification_id);
}

CausalDependency FromProto(const chronicle::log::CausalDependency& proto) {
    return CausalDependency{proto.log_id(), proto.notification_id()};
}

void ToProto(const NotificationSection& section, chronicle::log::NotificationSection* proto) {
    proto->Clear();
    proto->set_section_id(section.section_id);
    if (section.previous_id) {
        proto->set_previous_id(*section.previous_id);
    }
    if (section.next_id) {
        proto->set_next_id(*section.next_id);
    }
    for (const auto& slot : section.items) {
        chronicle::log::Notification* item = proto->add_items();
        if (!slot) {
            item->set_present(false);
            continue;
        }
        item->set_present(true);
        item->set_id(slot->id);
        item->set_topic(slot->topic);
        item->set_data(slot->data);
        for (const CausalDependency& dependency : slot->causal_dependencies) {
            ToProto(dependency, item->add_causal_dependencies());
        }
    }
}

NotificationSection FromProto(const chronicle::log::NotificationSection& proto) {
    NotificationSection section;
    section.section_id = proto.section_id();
    if (!proto.previous_id().empty()) {
        section.previous_id = proto.previous_id();
    }
    if (!proto.next_id().empty()) {
        section.next_id = proto.next_id();
    }
    section.items.reserve(proto.items_size());
    for (const auto& item : proto.items()) {
        if (!item.present()) {
            section.items.emplace_back(std::nullopt);
            continue;
        }
        Notification notification;
        notification.id = item.id();
        notification.topic = item.topic();
        notification.data = item.data();
        for (const auto& dependency : item.causal_dependencies()) {
            notification.causal_dependencies.push_back(FromProto(dependency));
        }
        section.items.emplace_back(std::move(notification));
    }
    return section;
}

std::string SectionToJson(const NotificationSection& section) {
    chronicle::log::NotificationSection proto;
    ToProto(section, &proto);

    google::protobuf::util::JsonPrintOptions options;
    options.always_print_primitive_fields = true;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(proto, &json, options);
    if (!status.ok()) {
        throw std::runtime_error("Failed to encode section " + section.section_id + ": " +
                                 status.ToString());
    }
    return json;
}

NotificationSection SectionFromJson(const std::string& json) {
    chronicle::log::NotificationSection proto;
    auto status = google::protobuf::util::JsonStringToMessage(json, &proto);
    if (!status.ok()) {
        throw std::invalid_argument("Malformed section document: " + status.ToString());
    }
    return FromProto(proto);
}

std::string ComputeETag(const NotificationSection& section) {
    size_t filled = 0;
    for (const auto& slot : section.items) {
        if (slot) {
            ++filled;
        }
    }
    return absl::StrCat(section.section_id, "/", section.items.size(), "/", filled);
}

} // namespace Chronicle
