#pragma once

#include <gmock/gmock.h>
#include "presencelink/core/byte_stream.hpp"

namespace presencelink {
namespace core {

class MockByteStream : public ByteStream {
public:
    MOCK_METHOD(Result<size_t>, readSome, (uint8_t* buffer, size_t size), (override));
    MOCK_METHOD(Result<size_t>, writeSome, (const uint8_t* data, size_t size), (override));
    MOCK_METHOD(Result<void>, flush, (), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(bool, isOpen, (), (const, override));
};

} // namespace core
} // namespace presencelink
