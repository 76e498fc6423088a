#include "copyexif/exif_clone.h"

#include <cstring>

namespace copyexif {
namespace {

    // Where the source block goes and which destination bytes surround it.
    struct ClonePlan final {
        ExifCloneResult result;
        std::span<const std::byte> src_block;
        // dest[0, prefix_size) + src_block + dest[suffix_offset, end)
        uint64_t prefix_size   = 0;
        uint64_t suffix_offset = 0;
    };


    static void plan_clone(const ImageHeader& src_header,
                           std::span<const std::byte> dest,
                           const ExifCloneOptions& options,
                           ClonePlan* plan)
    {
        const uint64_t dest_size = static_cast<uint64_t>(dest.size());
        plan->src_block          = src_header.exif_block();

        if (plan->src_block.size() <= kExifBlockHeaderSize) {
            plan->src_block     = {};
            plan->result.mode   = ExifCloneMode::Unchanged;
            plan->result.needed = dest_size;
            plan->prefix_size   = dest_size;
            plan->suffix_offset = dest_size;
            return;
        }

        const uint64_t src_size     = plan->src_block.size();
        plan->result.src_exif_bytes = src_size;

        const ImageHeader dest_header(dest, options.header);
        if (dest_header.has_exif()) {
            const uint64_t offset  = dest_header.exif_start_offset();
            const uint64_t removed = dest_header.exif_block().size();
            plan->result.mode               = ExifCloneMode::Replaced;
            plan->result.removed_exif_bytes = removed;
            plan->result.exif_offset        = offset;
            plan->result.needed             = dest_size - removed + src_size;
            plan->prefix_size               = offset;
            plan->suffix_offset             = offset + removed;
            return;
        }

        // Right after the SOI marker.
        const uint64_t soi = (dest_size < 2U) ? dest_size : 2U;
        plan->result.mode        = ExifCloneMode::Inserted;
        plan->result.exif_offset = soi;
        plan->result.needed      = dest_size + src_size;
        plan->prefix_size        = soi;
        plan->suffix_offset      = soi;
    }


    static void emit_clone(const ClonePlan& plan,
                           std::span<const std::byte> dest,
                           std::byte* out) noexcept
    {
        size_t pos = 0;
        if (plan.prefix_size != 0U) {
            std::memcpy(out, dest.data(), static_cast<size_t>(plan.prefix_size));
            pos += static_cast<size_t>(plan.prefix_size);
        }
        if (!plan.src_block.empty()) {
            std::memcpy(out + pos, plan.src_block.data(),
                        plan.src_block.size());
            pos += plan.src_block.size();
        }
        const size_t tail = dest.size() - static_cast<size_t>(plan.suffix_offset);
        if (tail != 0U) {
            std::memcpy(out + pos,
                        dest.data() + static_cast<size_t>(plan.suffix_offset),
                        tail);
        }
    }

}  // namespace

ExifCloneResult
clone_exif(std::span<const std::byte> src, std::span<const std::byte> dest,
           std::span<std::byte> out, const ExifCloneOptions& options)
{
    if (src.empty() || dest.empty()) {
        ExifCloneResult res;
        res.status = ExifCloneStatus::EmptyInput;
        return res;
    }

    const ImageHeader src_header(src, options.header);
    ClonePlan plan;
    plan_clone(src_header, dest, options, &plan);

    if (plan.result.needed > out.size()) {
        plan.result.status = ExifCloneStatus::OutputTruncated;
        return plan.result;
    }
    emit_clone(plan, dest, out.data());
    plan.result.written = plan.result.needed;
    return plan.result;
}


ExifCloneResult
clone_exif(std::span<const std::byte> src, std::span<const std::byte> dest,
           std::vector<std::byte>* out, const ExifCloneOptions& options)
{
    out->clear();
    if (src.empty() || dest.empty()) {
        ExifCloneResult res;
        res.status = ExifCloneStatus::EmptyInput;
        return res;
    }

    const ImageHeader src_header(src, options.header);
    ClonePlan plan;
    plan_clone(src_header, dest, options, &plan);

    out->resize(static_cast<size_t>(plan.result.needed));
    emit_clone(plan, dest, out->data());
    plan.result.written = plan.result.needed;
    return plan.result;
}

}  // namespace copyexif
