#include "result.hpp"

namespace collector::queue {

const char* ToString(QueueError code) {
  switch (code) {
    case QueueError::OK:
      return "ok";
    case QueueError::Unavailable:
      return "unavailable";
    case QueueError::OutOfOrder:
      return "out_of_order";
  }
  return "unknown";
}

} // namespace collector::queue
