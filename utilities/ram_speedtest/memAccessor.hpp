#ifndef MEM_ACCESSOR_H
#define MEM_ACCESSOR_H

#include <cstddef>
#include <cstdint>

/** \class      MemAccessor
 *  \brief      Performs the bulk operations the benchmark times
 *  \details    The MemAccessor class is an abstract base class for the two operations a benchmark loop
 *              performs on the buffer: filling every byte with a fixed value and folding a checksum
 *              over every byte. An implementation reports a fault by throwing std::runtime_error;
 *              the engine turns that into a failed phase.
 *  \example    DefaultMemAccessor
 */
class MemAccessor
{
    public:
        /// The destructor must be virtual to ensure that derived classes' destructors are also called when the objects are destroyed.
        virtual ~MemAccessor();

        /** Overwrite every byte of a region with the same value.
         *  \param pData           Start of the region.
         *  \param ulSize_bytes    Number of bytes to write.
         *  \param u8Value         Value written to every byte.
         */
        virtual void fill(char *pData, size_t ulSize_bytes, uint8_t u8Value) = 0;

        /** Continue a running checksum over every byte of a region.
         *  \param pData           Start of the region.
         *  \param ulSize_bytes    Number of bytes to read.
         *  \param u32Checksum     Checksum carried over from the previous call.
         *  \return The updated checksum.
         */
        virtual uint32_t checksum(const char *pData, size_t ulSize_bytes, uint32_t u32Checksum) = 0;

    protected:
        /// The constructor is protected as a reminder that we can't instantiate a pure virtual class directly.
        MemAccessor();
};

/** \class   DefaultMemAccessor
 *  \brief   memset for writes and zlib's Adler-32 for reads
 */
class DefaultMemAccessor : public MemAccessor
{
    public:
        DefaultMemAccessor();
        ~DefaultMemAccessor();

        void fill(char *pData, size_t ulSize_bytes, uint8_t u8Value) override;
        uint32_t checksum(const char *pData, size_t ulSize_bytes, uint32_t u32Checksum) override;
};

#endif
