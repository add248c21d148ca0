#include "ObjectMetaData.hpp"

#include <filesystem>
#include <sstream>
#include <system_error>

#include <sys/stat.h>

#include <google/protobuf/util/time_util.h>
#include <google/protobuf/timestamp.pb.h>

namespace {
    google::protobuf::Timestamp TimespecToTimestamp(const struct timespec& ts)
    {
        google::protobuf::Timestamp out;

        out.set_seconds(ts.tv_sec);
        out.set_nanos(static_cast<int32_t>(ts.tv_nsec));

        return out;
    }

    enum class FileTimeKind {
        Mtime, Ctime
    };

    google::protobuf::Timestamp PathToTimestamp(const std::filesystem::path &path, FileTimeKind kind) {
        struct stat st;

        if (stat(path.c_str(), &st) != 0)
            return {};

        switch (kind) {
        case FileTimeKind::Mtime:
            return TimespecToTimestamp(st.st_mtim);
        case FileTimeKind::Ctime:
            return TimespecToTimestamp(st.st_ctim);
        }

        return {}; // unreachable
    }
}

ObjectMetaData MakeObjectMetaDataFrom(const std::filesystem::path& from, const std::string& container,
                                      const std::string& key, const std::string& etag)
{
    ObjectMetaData data;

    std::error_code ec;
    const uintmax_t size = std::filesystem::file_size(from, ec);

    data.set_container(container);
    data.set_key(key);
    data.set_size(ec ? 0 : static_cast<uint64_t>(size));
    data.set_etag(etag);

    data.mutable_create_time()->CopyFrom(PathToTimestamp(from, FileTimeKind::Ctime));
    data.mutable_modify_time()->CopyFrom(PathToTimestamp(from, FileTimeKind::Mtime));

    return data;
}

std::string ObjectMetaDataToString(const ObjectMetaData& metadata)
{
    using google::protobuf::util::TimeUtil;

    std::stringstream ss;

    ss << "object: s3://" << metadata.container() << "/" << metadata.key() << std::endl;
    ss << "size: " << metadata.size() << std::endl;
    ss << "etag: " << metadata.etag() << std::endl;
    ss << "ctime: " << TimeUtil::ToString(metadata.create_time()) << std::endl;
    ss << "mtime: " << TimeUtil::ToString(metadata.modify_time()) << std::endl;

    return ss.str();
}
