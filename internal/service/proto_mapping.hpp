#pragma once

#include <cstdint>
#include <optional>

#include "google/protobuf/timestamp.pb.h"

#include "fleet/control/v1.hpp"
#include "internal/db/model/command_record.hpp"
#include "internal/db/model/credential_record.hpp"
#include "internal/db/model/download_link_record.hpp"
#include "internal/db/model/job_record.hpp"

namespace fleet::service {

/*
  Record <-> wire conversions. Hashes never leave the server, so the
  credential view drops key_hash.
*/

fleet::control::v1::Credential    ToProto(const db::model::CredentialRecord& record);
fleet::control::v1::ScheduledJob  ToProto(const db::model::JobRecord& record);
fleet::control::v1::RemoteCommand ToProto(const db::model::CommandRecord& record);
fleet::control::v1::DownloadLink  ToProto(const db::model::DownloadLinkRecord& record, uint64_t now_ms);

fleet::control::v1::JobStatus      ToProto(fleet::model::JobStatus status);
fleet::control::v1::CommandStatus  ToProto(fleet::model::CommandStatus status);
fleet::control::v1::Recurrence     ToProto(fleet::model::Recurrence recurrence);
fleet::control::v1::LinkVisibility ToProto(db::model::LinkVisibility visibility);

// InvalidArgument for UNSPECIFIED or unknown values.
fleet::model::Recurrence     FromProto(fleet::control::v1::Recurrence recurrence);
fleet::model::CommandStatus  FromProto(fleet::control::v1::CommandStatus status);
db::model::LinkVisibility    FromProto(fleet::control::v1::LinkVisibility visibility);

// Seconds from the wire as milliseconds. InvalidArgument when now_ms plus
// the result would not fit in 64 bits.
uint64_t SecondsToMs(uint64_t sec, uint64_t now_ms, const char* field);

// InvalidArgument before the epoch or beyond what the clock can hold.
uint64_t TimestampToMs(const google::protobuf::Timestamp& ts, const char* field);

} // namespace fleet::service
