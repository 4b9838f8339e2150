// ============================================================================
// event.cpp — implementation for bacgate/event.hpp
// ============================================================================

#include "bacgate/event.hpp"

#include <cstdlib>      // strtof: round-trip check in format_value
#include <iomanip>      // std::setprecision, std::setw, std::setfill
#include <locale>       // classic locale for '.' decimal point
#include <sstream>      // std::ostringstream for the key=value lines

namespace bacgate {

BacnetEvent BacnetEvent::make_who_is(const WhoIs& w, const BipAddress& from) {
    BacnetEvent ev;
    ev.kind = EventKind::WhoIs;
    ev.service_choice = SERVICE_WHO_IS;
    ev.who_is = w;
    ev.source = from;
    return ev;
}

BacnetEvent BacnetEvent::make_i_am(const IAm& a, const BipAddress& from) {
    BacnetEvent ev;
    ev.kind = EventKind::IAm;
    ev.service_choice = SERVICE_I_AM;
    ev.i_am = a;
    ev.source = from;
    return ev;
}

BacnetEvent BacnetEvent::make_read_request(const ReadPropertyRequest& r, uint8_t invoke_id,
                                           const BipAddress& from) {
    BacnetEvent ev;
    ev.kind = EventKind::ReadPropertyRequest;
    ev.service_choice = SERVICE_READ_PROPERTY;
    ev.invoke_id = invoke_id;
    ev.read_request = r;
    ev.source = from;
    return ev;
}

BacnetEvent BacnetEvent::make_read_ack(const ReadPropertyAck& a, uint8_t invoke_id,
                                       const BipAddress& from) {
    BacnetEvent ev;
    ev.kind = EventKind::ReadPropertyAck;
    ev.service_choice = SERVICE_READ_PROPERTY;
    ev.invoke_id = invoke_id;
    ev.read_ack = a;
    ev.source = from;
    return ev;
}

BacnetEvent BacnetEvent::make_timeout(uint8_t invoke_id, uint8_t service, const ObjectIdentifier& obj,
                                      uint32_t property, const BipAddress& target) {
    BacnetEvent ev;
    ev.kind = EventKind::RequestTimeout;
    ev.service_choice = service;
    ev.invoke_id = invoke_id;
    ev.read_request.object = obj;
    ev.read_request.property = property;
    ev.source = target;
    return ev;
}

const char* event_kind_name(EventKind k) {
    switch (k) {
        case EventKind::WhoIs:               return "who_is";
        case EventKind::IAm:                 return "i_am";
        case EventKind::ReadPropertyRequest: return "read_property";
        case EventKind::ReadPropertyAck:     return "read_property_ack";
        case EventKind::RequestTimeout:      return "request_timeout";
    }
    return "unknown";
}

static const char* segmentation_name(Segmentation s) {
    switch (s) {
        case Segmentation::Both:     return "both";
        case Segmentation::Transmit: return "transmit";
        case Segmentation::Receive:  return "receive";
        case Segmentation::None:     return "none";
    }
    return "unknown";
}

// "type:instance", e.g. "0:0" for Analog-Input 0
static void put_object(std::ostringstream& os, const ObjectIdentifier& o) {
    os << static_cast<unsigned>(o.type) << ':' << o.instance;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (uint8_t b : bytes) os << std::setw(2) << static_cast<unsigned>(b);
    return os.str();
}

// ---------------------------------------------------------------------------
// format_value()
// Fewest decimals, in plain fixed notation, that strtof reads back as the
// same float: 24.5, 100, 0.1, 10000000000. The smallest subnormal needs 45
// decimals plus 9 significant digits, so the loop always ends by 54.
// ---------------------------------------------------------------------------
static bool round_trips(const std::string& text, float v) {
    return std::strtof(text.c_str(), nullptr) == v;
}

std::string format_value(float v) {
    std::string text;
    for (int decimals = 0; decimals <= 54; ++decimals) {
        std::ostringstream os;
        os.imbue(std::locale::classic());
        os << std::fixed << std::setprecision(decimals) << v;
        text = os.str();
        if (round_trips(text, v)) break;
    }
    return text;
}

std::string describe(const BacnetEvent& ev) {
    std::ostringstream os;
    os << "event=" << event_kind_name(ev.kind);

    switch (ev.kind) {
        case EventKind::WhoIs:
            if (ev.who_is.range)
                os << " low=" << ev.who_is.range->low << " high=" << ev.who_is.range->high;
            else
                os << " range=all";
            break;

        case EventKind::IAm:
            os << " device=" << ev.i_am.device.instance
               << " vendor=" << ev.i_am.vendor_id
               << " max_apdu=" << ev.i_am.max_apdu
               << " segmentation=" << segmentation_name(ev.i_am.segmentation);
            break;

        case EventKind::ReadPropertyRequest:
            os << " invoke=" << static_cast<unsigned>(ev.invoke_id) << " object=";
            put_object(os, ev.read_request.object);
            os << " property=" << ev.read_request.property;
            if (ev.read_request.array_index) os << " index=" << *ev.read_request.array_index;
            break;

        case EventKind::ReadPropertyAck: {
            os << " invoke=" << static_cast<unsigned>(ev.invoke_id) << " object=";
            put_object(os, ev.read_ack.object);
            os << " property=" << ev.read_ack.property
               << " tag=" << static_cast<unsigned>(ev.read_ack.value.app_tag);
            const auto f = decode_real(ev.read_ack.value);
            if (f) os << " value=" << format_value(*f);
            else   os << " raw=" << to_hex(ev.read_ack.value.raw);
            break;
        }

        case EventKind::RequestTimeout:
            os << " invoke=" << static_cast<unsigned>(ev.invoke_id)
               << " service=" << static_cast<unsigned>(ev.service_choice) << " object=";
            put_object(os, ev.read_request.object);
            os << " property=" << ev.read_request.property;
            break;
    }

    os << " source=" << ev.source.to_string();
    return os.str();
}

} // namespace bacgate
