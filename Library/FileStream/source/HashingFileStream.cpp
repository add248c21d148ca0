#include "HashingFileStream.hpp"

#include <sstream>

HashingFileStream::HashingFileStream(const std::filesystem::path& path, Hasher::Type type)
    : file_(path)
    , hasher_(type)
{
}

std::optional<HashingFileStream::Error> HashingFileStream::Open(std::ios::openmode mode) noexcept
{
    digest_.reset();
    written_ = 0;

    if (auto err = file_.Open(mode))
        return err;

    if (auto herr = hasher_.Initialize()) {
        (void)file_.Close();
        return ConvertHasherError(*herr);
    }

    return std::nullopt;
}

std::optional<HashingFileStream::Error> HashingFileStream::Write(std::string_view data) noexcept
{
    if (auto err = file_.Write(data))
        return err;

    if (data.empty())
        return std::nullopt;

    if (auto herr = hasher_.Update(data))
        return ConvertHasherError(*herr);

    written_ += data.size();

    return std::nullopt;
}

std::optional<HashingFileStream::Error> HashingFileStream::Close() noexcept
{
    auto [ok, digest, herr] = hasher_.Finalize();
    if (!ok) {
        (void)file_.Close();
        return ConvertHasherError(herr);
    }

    digest_ = std::move(digest);
    if (auto err = file_.Close())
        return err;

    return std::nullopt;
}

uint64_t HashingFileStream::GetBytesWritten() const noexcept
{
    return written_;
}

std::optional<std::vector<uint8_t>> HashingFileStream::GetHash() const noexcept
{
    return digest_;
}

std::optional<std::string> HashingFileStream::GetHashHex() const
{
    if (!digest_.has_value())
        return std::nullopt;

    return Hasher::ToHex(*digest_);
}

HashingFileStream::Error HashingFileStream::ConvertHasherError(const Hasher::Error& e)
{
    std::ostringstream oss;
    oss << "hasher: (" << e.code << ") " << e.message;
    return Error{ e.code, oss.str() };
}
