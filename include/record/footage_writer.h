#pragma once
#include <cstdint>
#include <string>

#include "core/frame.h"

namespace record {

    // Opaque destination id issued by a FootageWriter. 0 is never valid.
    using DestinationHandle = std::uint64_t;
    constexpr DestinationHandle kInvalidDestination = 0;

// Footage sink. The session manager only sequences open/write/close; storage
// format and location belong to the implementation.
    class FootageWriter {
    public:
        virtual ~FootageWriter() = default;

        virtual bool open_destination(long long wall_ms, DestinationHandle& out, std::string& err) = 0;
        virtual bool write_frame(DestinationHandle handle, const core::Frame& frame, std::string& err) = 0;
        virtual void close(DestinationHandle handle) = 0;
    };

} // namespace record
