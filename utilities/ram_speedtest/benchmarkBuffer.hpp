#ifndef BENCHMARK_BUFFER_H
#define BENCHMARK_BUFFER_H

#include <cstddef>
#include <cstdint>

/// Huge page size used to round lengths of MAP_HUGETLB mappings
#define HUGE_PAGE_SIZE_BYTES (2ULL*1024ULL*1024ULL)

/** \class      BenchmarkBuffer
 *  \brief      Owns the single large region the benchmark writes to and reads from
 *  \details    The region is an anonymous private mapping. mmap is used instead of malloc as it allows
 *              huge pages to be used and guarantees the memory is returned to the operating system
 *              as soon as the buffer is released. Huge pages need to be configured correctly on the
 *              OS or else allocation fails.
 */
class BenchmarkBuffer
{
    public:
        /// The default constructor is disabled.
        BenchmarkBuffer() = delete;

        /** Maps the region. Pages are not committed until they are written.
         *  \param u64Size_bytes   Number of bytes to allocate.
         *  \param bUseHugePages   Back the region with huge pages.
         *  \throws std::runtime_error describing the failed mmap call if the region could not be mapped.
         */
        BenchmarkBuffer(uint64_t u64Size_bytes, bool bUseHugePages);

        /// Destructor releases the region.
        ~BenchmarkBuffer();

        BenchmarkBuffer(const BenchmarkBuffer &) = delete;
        BenchmarkBuffer &operator=(const BenchmarkBuffer &) = delete;

        char *data() { return m_pData; }

        /// Number of usable bytes. Always the size that was requested.
        size_t size() const { return m_ulSize_bytes; }

        /// Number of bytes actually mapped. Rounded up to a multiple of HUGE_PAGE_SIZE_BYTES when huge pages are used.
        size_t mapped_size() const { return m_ulMapped_bytes; }

    private:
        /// Unmap the region. Safe to call more than once.
        void release();

        ///Pointer to the start of the mapping
        char *m_pData;

        ///Size requested by the caller
        size_t m_ulSize_bytes;

        ///Size actually mapped, rounded up to a huge page boundary when huge pages are used
        size_t m_ulMapped_bytes;
};

#endif
