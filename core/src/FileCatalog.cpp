// Extension tables and file stat for new queue items.
#include "meterlink/FileCatalog.hpp"
#include "meterlink/Log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace meterlink {

namespace fs = std::filesystem;

static std::string lowerExtension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::optional<FileCategory> classifyFile(const std::string& path) {
    const std::string ext = lowerExtension(path);
    if (ext == ".xlsx" || ext == ".xls") return FileCategory::Tabular;
    if (ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".bmp") return FileCategory::Image;
    return std::nullopt;
}

std::string defaultDescription(FileCategory category, const std::string& path) {
    return std::string(toString(category)) + " - " + fs::path(path).stem().string();
}

bool makeTransferItem(const std::string& path,
                      const std::optional<std::string>& description,
                      TransferItem& out,
                      std::string& err) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        err = "File does not exist: " + path;
        return false;
    }
    auto category = classifyFile(path);
    if (!category) {
        err = "Unsupported file type: " + fs::path(path).extension().string();
        return false;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        err = "Cannot read size of " + path + ": " + ec.message();
        return false;
    }

    TransferItem item;
    item.path = path;
    item.category = *category;
    item.size = static_cast<std::uint64_t>(size);
    item.description = description ? *description : defaultDescription(*category, path);
    out = item;
    LOGD("catalog: %s -> %s (%llu bytes)", path.c_str(), toString(*category),
         static_cast<unsigned long long>(item.size));
    return true;
}

} // namespace meterlink
