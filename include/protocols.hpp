// Wire protocol shared between the firmware and the voice server
#pragma once

#include <cstdint>

// WebSocket binary protocol
// Header layout (little-endian, packed):
//  - kind: uint8_t   (message kind)
//  - messageType: uint8_t  (START/DATA/END/CANCEL)
//  - reserved: uint8_t (0, future flags)
//  - seq: uint16 (sequence number)
//  - payloadBytes: uint16 (bytes following the header)
//
// START payload (optional): <uint32 sample_rate><uint16 channels>

enum class MessageKind : uint8_t
{
	AudioPcm = 1,   // uplink PCM16LE mic stream (client -> server)
	AudioReply = 2, // downlink PCM16LE reply stream (server -> client)
};

enum class MessageType : uint8_t
{
	START = 1,
	DATA = 2,
	END = 3,
	CANCEL = 4, // server interrupts the reply in progress
};

struct __attribute__((packed)) WsHeader
{
	uint8_t kind;        // MessageKind
	uint8_t messageType; // MessageType
	uint8_t reserved;    // 0 (flags/reserved)
	uint16_t seq;        // sequence number
	uint16_t payloadBytes; // bytes following the header
};

static_assert(sizeof(WsHeader) == 7, "WsHeader must stay packed");
