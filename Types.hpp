#pragma once

using U8 = uint8_t;
using U16 = uint16_t;
using U32 = uint32_t;
using U64 = uint64_t;

using F32 = float;
using F64 = double;

using String = std::string;

template<typename T>
using Vector = std::vector<T>;

template<typename A, typename B>
using UnorderedMap = std::unordered_map < A, B >;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

// Raw image object bytes, as loaded from the object store.
using ByteBuffer = Vector<U8>;

using SpeciesId = U32;		// `species`.`id`
using LocationId = U32;		// `locations`.`id`
using ImageId = U64;		// `images`.`id`
using DetectionId = U64;	// `detections`.`id`

// AUTO_INCREMENT keys start from 1, so zero is never a valid row id.
constexpr SpeciesId InvalidSpeciesId = 0;
constexpr LocationId InvalidLocationId = 0;
constexpr ImageId InvalidImageId = 0;

// Deadlines, leases and reconnect timers, never wall clock.
using TimePoint = std::chrono::time_point<std::chrono::steady_clock>;

using SocketId = int;

#ifndef INVALID_SOCKET
#define INVALID_SOCKET (SocketId)(~0)
#endif

#ifndef SOCKET_ERROR
#define SOCKET_ERROR (-1)
#endif
