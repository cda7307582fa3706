// Local file inspection: extension-based classification and queue item construction.
#pragma once
#include "Types.hpp"
#include <optional>
#include <string>

namespace meterlink {

// .xlsx/.xls -> Tabular, .jpg/.jpeg/.png/.bmp -> Image (case-insensitive).
std::optional<FileCategory> classifyFile(const std::string& path);

// "Tabular data - <stem>" / "Image data - <stem>"
std::string defaultDescription(FileCategory category, const std::string& path);

// Stat + classify. Fails when the file does not exist or is not a supported type.
bool makeTransferItem(const std::string& path,
                      const std::optional<std::string>& description,
                      TransferItem& out,
                      std::string& err);

} // namespace meterlink
