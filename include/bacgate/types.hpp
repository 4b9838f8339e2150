#ifndef BACGATE_TYPES_HPP
#define BACGATE_TYPES_HPP
/**
 * @page bg-types bacgate protocol constants
 * @file types.hpp
 * @brief Object identifiers, service choices, property ids and decode error codes.
 *
 * @details
 * PURPOSE
 * -------
 * The numbers in this file are part of the BACnet wire contract (ASHRAE 135).
 * They are collected here so every codec layer agrees on them and so a reader
 * can grep one place for "what is 12 again?".
 *
 * Only the subset this gateway speaks is listed: the discovery pair
 * (Who-Is / I-Am), ReadProperty, and the object/property identifiers the poller
 * asks for. Adding a service means adding its choice number here first.
 *
 * ERROR MODEL
 * -----------
 * Decoders never throw and never read past the buffer they were given. Every
 * decode function returns a DecodeError; DecodeError::None means success and
 * the output parameters are valid. Anything else means "drop this frame".
 */

#include <stdint.h>
#include <stddef.h>

namespace bacgate {

// ============================== Object model ==============================

/// Largest instance number that fits the 22-bit instance field.
static constexpr uint32_t MAX_INSTANCE = 0x3FFFFF;   // 4194303

/// Largest object type that fits the 10-bit type field.
static constexpr uint16_t MAX_OBJECT_TYPE = 0x3FF;

/**
 * @brief Object types used by this gateway (numbering per ASHRAE 135 clause 21).
 *
 * Unknown types still decode: ObjectIdentifier carries the raw 10-bit value.
 */
enum class ObjectType : uint16_t {
  AnalogInput  = 0,
  AnalogOutput = 1,
  AnalogValue  = 2,
  BinaryInput  = 3,
  BinaryOutput = 4,
  BinaryValue  = 5,
  Device       = 8
};

/**
 * @struct ObjectIdentifier
 * @brief (object type, instance) pair; packs to 32 bits as (type << 22) | instance.
 */
struct ObjectIdentifier {
  ObjectType type{ObjectType::AnalogInput};
  uint32_t   instance{0};

  ObjectIdentifier() = default;
  ObjectIdentifier(ObjectType t, uint32_t inst) : type(t), instance(inst) {}

  /// Pack to the 32-bit wire value. Out-of-range fields are masked.
  uint32_t pack() const {
    return (uint32_t(static_cast<uint16_t>(type) & MAX_OBJECT_TYPE) << 22) | (instance & MAX_INSTANCE);
  }

  /// Unpack the 32-bit wire value.
  static ObjectIdentifier unpack(uint32_t v) {
    return ObjectIdentifier(static_cast<ObjectType>((v >> 22) & MAX_OBJECT_TYPE), v & MAX_INSTANCE);
  }

  bool is_device() const { return type == ObjectType::Device; }

  bool operator==(const ObjectIdentifier& o) const { return type == o.type && instance == o.instance; }
  bool operator!=(const ObjectIdentifier& o) const { return !(*this == o); }
};

/// Property identifiers this gateway reads or logs.
enum : uint32_t {
  PROP_OBJECT_IDENTIFIER = 75,
  PROP_OBJECT_NAME       = 77,
  PROP_PRESENT_VALUE     = 85,
  PROP_UNITS             = 117
};

/// Segmentation-supported enumeration carried in I-Am.
enum class Segmentation : uint8_t {
  Both     = 0,
  Transmit = 1,
  Receive  = 2,
  None     = 3
};

// ============================== Services ==================================

/// Unconfirmed service choices (clause 21, BACnetUnconfirmedServiceChoice).
enum : uint8_t {
  SERVICE_I_AM   = 0,
  SERVICE_WHO_IS = 8
};

/// Confirmed service choices (clause 21, BACnetConfirmedServiceChoice).
enum : uint8_t {
  SERVICE_READ_PROPERTY = 12
};

/// Largest APDU this gateway accepts (B/IP maximum).
static constexpr uint16_t MAX_APDU_LENGTH = 1476;

// ============================== Errors ====================================

/**
 * @brief Why a frame (or part of one) could not be decoded.
 *
 * These never escape as fatal errors: the engine drops the frame and moves on.
 */
enum class DecodeError : uint8_t {
  None = 0,                 ///< decoded; outputs are valid
  InvalidLength,            ///< truncated input or length field overrun
  InvalidVersion,           ///< NPDU protocol version is not 1
  InvalidTag,               ///< tag number/class not what the grammar expects
  UnsupportedPdu,           ///< APDU type outside the three supported forms
  SegmentationUnsupported,  ///< segmented APDU (out of scope)
  InvalidValue              ///< field decoded but value out of range
};

/// Short lowercase name for logs ("invalid_length", ...).
const char* decode_error_name(DecodeError e);

} // namespace bacgate

#endif // BACGATE_TYPES_HPP
