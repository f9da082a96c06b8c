#include <bspidx/common/utf8_utils.h>
#include <bspidx/extraction/device_tree_extractor.h>
#include <bspidx/extraction/fact_extractor.h>
#include <bspidx/extraction/header_extractor.h>
#include <bspidx/extraction/recipe_extractor.h>

#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace bspidx::extraction {

std::optional<FileFormat> formatForExtension(std::string_view extension) {
    std::string ext(extension);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".bb" || ext == ".bbappend" || ext == ".inc")
        return FileFormat::Recipe;
    if (ext == ".conf")
        return FileFormat::Config;
    if (ext == ".h")
        return FileFormat::Header;
    if (ext == ".dts" || ext == ".dtsi")
        return FileFormat::TreeSource;
    return std::nullopt;
}

const IFactExtractor& extractorFor(FileFormat format) {
    static const RecipeExtractor recipe;
    static const HeaderExtractor header;
    static const DeviceTreeExtractor deviceTree;

    switch (format) {
        case FileFormat::Recipe:
        case FileFormat::Config:
            return recipe;
        case FileFormat::Header:
            return header;
        case FileFormat::TreeSource:
            return deviceTree;
    }
    return recipe;
}

Result<FileFacts> extractFile(const FileDescriptor& file, const std::filesystem::path& projectRoot,
                              const ExtractionLimits& limits) {
    struct stat st {};
    if (::stat(file.path.c_str(), &st) != 0) {
        return Error{ErrorCode::FileNotFound,
                     "stat failed for " + file.path + ": " + std::strerror(errno)};
    }

    std::ifstream in(file.path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::PermissionDenied, "cannot open " + file.path};
    }
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IOError, "read failed for " + file.path};
    }

    FileFacts result;
    std::error_code ec;
    auto relative = std::filesystem::relative(file.path, projectRoot, ec);
    if (ec || relative.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     file.path + " is not under " + projectRoot.string()};
    }
    result.file.path = relative.generic_string();
    result.file.name = file.name;
    result.file.format = file.format;
    result.file.size = static_cast<int64_t>(st.st_size);
    result.file.mtime = static_cast<int64_t>(st.st_mtime);

    auto content = common::dropInvalidUtf8(raw);
    result.facts = extractorFor(file.format).extract(content, limits);
    return result;
}

} // namespace bspidx::extraction
