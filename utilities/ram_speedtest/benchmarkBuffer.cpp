#include "benchmarkBuffer.hpp"
#include "Utils.hpp"

#include <cerrno>
#include <limits>
#include <stdexcept>
#include <sys/mman.h>

BenchmarkBuffer::BenchmarkBuffer(uint64_t u64Size_bytes, bool bUseHugePages):
    m_pData(nullptr),
    m_ulSize_bytes(0),
    m_ulMapped_bytes(0)
{
    if (u64Size_bytes == 0 || u64Size_bytes > std::numeric_limits<size_t>::max() - HUGE_PAGE_SIZE_BYTES)
    {
        throw std::runtime_error("cannot allocate a buffer of the requested size");
    }

    size_t ulMapped_bytes = (size_t)u64Size_bytes;
    int flags = MAP_PRIVATE | MAP_ANONYMOUS;
    if (bUseHugePages)
    {
        flags |= MAP_HUGETLB;
        ulMapped_bytes = (ulMapped_bytes + HUGE_PAGE_SIZE_BYTES - 1) / HUGE_PAGE_SIZE_BYTES * HUGE_PAGE_SIZE_BYTES;
    }

    void *addr = mmap(NULL, ulMapped_bytes, PROT_READ | PROT_WRITE, flags, -1, 0);
    if (addr == MAP_FAILED)
    {
        throw std::runtime_error(describe_errno(bUseHugePages ? "mmap (huge pages)" : "mmap", errno));
    }

    m_pData = (char *) addr;
    m_ulSize_bytes = (size_t)u64Size_bytes;
    m_ulMapped_bytes = ulMapped_bytes;
}

BenchmarkBuffer::~BenchmarkBuffer()
{
    release();
}

void BenchmarkBuffer::release()
{
    if (m_pData != nullptr)
    {
        // munmap only fails for invalid arguments, which would mean the mapping was never ours
        munmap(m_pData, m_ulMapped_bytes);
        m_pData = nullptr;
        m_ulSize_bytes = 0;
        m_ulMapped_bytes = 0;
    }
}
