// SHARELEDGER - Serialization Framework
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Binary serialization for ledger records and database keys.
//
// Format:
// - Integers are fixed-width little-endian
// - bool is a single byte (0 or 1)
// - Strings are CompactSize length-prefixed
// - Hashes are raw bytes
//
// Records provide free Serialize/Unserialize overloads next to their
// definition so DataStream << and >> can find them.

#ifndef SHARELEDGER_CORE_SERIALIZE_H
#define SHARELEDGER_CORE_SERIALIZE_H

#include "shareledger/core/types.h"

#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace shareledger {

/// Maximum size of a serialized string or container
constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using size_type = std::size_t;

    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    void clear() {
        data_.clear();
        read_pos_ = 0;
    }

    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    /// Whole buffer, including already-read bytes
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data_.data() + read_pos_, len);
        }
        read_pos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    /// Copy of the serialized bytes as a string (for database values)
    std::string ToString() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    /// Hex dump of the unread bytes
    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream, typename UInt>
inline void ser_writeLE(Stream& s, UInt value) {
    uint8_t buf[sizeof(UInt)];
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(buf, sizeof(UInt));
}

template<typename UInt, typename Stream>
inline UInt ser_readLE(Stream& s) {
    uint8_t buf[sizeof(UInt)];
    s.Read(buf, sizeof(UInt));
    UInt value = 0;
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        value |= static_cast<UInt>(buf[i]) << (8 * i);
    }
    return value;
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 3 bytes (0xFD + 2 bytes little-endian)
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
//   size >  0xFFFFFFFF -- 9 bytes (0xFF + 8 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writeLE<Stream, uint8_t>(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        ser_writeLE<Stream, uint8_t>(s, 0xFD);
        ser_writeLE<Stream, uint16_t>(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writeLE<Stream, uint8_t>(s, 0xFE);
        ser_writeLE<Stream, uint32_t>(s, static_cast<uint32_t>(size));
    } else {
        ser_writeLE<Stream, uint8_t>(s, 0xFF);
        ser_writeLE<Stream, uint64_t>(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readLE<uint8_t>(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ser_readLE<uint16_t>(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 254) {
        size = ser_readLE<uint32_t>(s);
        if (size < 0x10000) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        size = ser_readLE<uint64_t>(s);
        if (size < 0x100000000ULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    }

    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }

    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writeLE<Stream, uint8_t>(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readLE<uint8_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writeLE<Stream, uint32_t>(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readLE<uint32_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writeLE<Stream, uint64_t>(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readLE<uint64_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writeLE<Stream, uint8_t>(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readLE<uint8_t>(s) != 0); }

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(static_cast<size_t>(size));
    if (size > 0) {
        s.Read(&str[0], static_cast<size_t>(size));
    }
}

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream>
void Serialize(Stream& s, const Hash160& hash) {
    s.Write(hash.data(), Hash160::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash160& hash) {
    s.Read(hash.data(), Hash160::SIZE);
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace shareledger

#endif // SHARELEDGER_CORE_SERIALIZE_H
