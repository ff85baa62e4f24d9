#include "codec_types.hpp"

namespace filepix {

    const char* statusName(Status s)
    {
        switch (s) {
            case Status::Ok:                return "Ok";
            case Status::SourceUnavailable: return "SourceUnavailable";
            case Status::TruncatedHeader:   return "TruncatedHeader";
            case Status::TruncatedPayload:  return "TruncatedPayload";
            case Status::CapacityExceeded:  return "CapacityExceeded";
            case Status::MalformedGrid:     return "MalformedGrid";
            case Status::UnsupportedImage:  return "UnsupportedImage";
            case Status::SinkUnavailable:   return "SinkUnavailable";
            case Status::LossyFormat:       return "LossyFormat";
        }
        return "Unknown";
    }

}
