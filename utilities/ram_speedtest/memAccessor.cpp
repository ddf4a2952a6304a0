#include "memAccessor.hpp"

#include <cstring>
#include <zlib.h>

MemAccessor::MemAccessor()
{
}

MemAccessor::~MemAccessor()
{
}

DefaultMemAccessor::DefaultMemAccessor()
{
}

DefaultMemAccessor::~DefaultMemAccessor()
{
}

void DefaultMemAccessor::fill(char *pData, size_t ulSize_bytes, uint8_t u8Value)
{
    std::memset(pData, u8Value, ulSize_bytes);
}

uint32_t DefaultMemAccessor::checksum(const char *pData, size_t ulSize_bytes, uint32_t u32Checksum)
{
    // adler32_z takes a z_size_t length so buffers larger than 4 GiB are handled in a single call
    uLong ulAdler = adler32_z(u32Checksum, reinterpret_cast<const Bytef *>(pData), ulSize_bytes);
    return (uint32_t)(ulAdler & 0xFFFFFFFFUL);
}
