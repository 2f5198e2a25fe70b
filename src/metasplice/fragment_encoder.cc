#include "metasplice/fragment_encoder.h"

#include <cstring>
#include <utility>

namespace metasplice {

FragmentSequence::FragmentSequence(const FragmentSource& source) noexcept
    : source_(&source)
{
}


bool
FragmentSequence::next(SharedBytes* out)
{
    uint64_t index = pos_;
    if (!source_->encode_at(&index, out)) {
        return false;
    }
    pos_ += 1;
    return true;
}


VectorSink::VectorSink(std::vector<std::byte>* out) noexcept
    : out_(out)
{
}


bool
VectorSink::write(std::span<const std::byte> bytes)
{
    out_->insert(out_->end(), bytes.begin(), bytes.end());
    return true;
}


SharedBytes
encode_to_bytes(const FragmentSource& source)
{
    std::vector<std::byte> out;
    out.reserve(static_cast<size_t>(source.encoded_size()));

    FragmentSequence seq(source);
    SharedBytes fragment;
    while (seq.next(&fragment)) {
        out.insert(out.end(), fragment.span().begin(), fragment.span().end());
    }
    return SharedBytes::from_vector(std::move(out));
}


ImageStatus
write_fragments(const FragmentSource& source, ByteSink& sink,
                uint64_t* written)
{
    uint64_t total = 0;
    FragmentSequence seq(source);
    SharedBytes fragment;
    while (seq.next(&fragment)) {
        if (!sink.write(fragment.span())) {
            if (written) {
                *written = total;
            }
            return ImageStatus::Io;
        }
        total += fragment.size();
    }
    if (written) {
        *written = total;
    }
    return ImageStatus::Ok;
}


FragmentReader::FragmentReader(const FragmentSource& source) noexcept
    : sequence_(source)
{
}


size_t
FragmentReader::read(std::span<std::byte> out)
{
    if (out.empty()) {
        return 0;
    }
    if (pending_.empty()) {
        if (!sequence_.next(&pending_)) {
            return 0;
        }
    }

    const size_t n = (out.size() < pending_.size()) ? out.size()
                                                    : pending_.size();
    std::memcpy(out.data(), pending_.data(), n);
    pending_ = pending_.slice_from(n);
    return n;
}

}  // namespace metasplice
