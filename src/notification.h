// notification.h
#pragma once
#include <optional>
#include <string>

#include "types.h"

namespace fsched {

enum class Recipient { Technician, Customer };

struct NotificationPayload {
  Recipient recipient = Recipient::Technician;
  std::string recipient_id;  // technician id, or job id for the job's customer
  std::string job_id;
  std::optional<ScheduleSlot> previous;
  std::optional<ScheduleSlot> current;
  std::string message;
};

// External delivery (SMS, push, email). Best effort; may throw.
class NotificationDispatcher {
 public:
  virtual ~NotificationDispatcher() = default;
  virtual void dispatch(const NotificationPayload& n) = 0;
};

}  // namespace fsched
