#include "capture_device.h"

const char *dev_status_str(dev_status s) {
  switch (s) {
    case dev_status::ok:                 return "ok";
    case dev_status::open_failed:        return "open failed";
    case dev_status::unsupported_format: return "unsupported format";
    case dev_status::allocation_failed:  return "allocation failed";
    case dev_status::map_failed:         return "map failed";
    case dev_status::enqueue_failed:     return "enqueue failed";
    case dev_status::dequeue_failed:     return "dequeue failed";
    case dev_status::stream_failed:      return "stream control failed";
    case dev_status::interrupted:        return "interrupted";
    case dev_status::would_block:        return "would block";
    default:                             return "unknown";
  }
}
