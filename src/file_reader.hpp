#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file via mmap, decode UTF-8 and drop every '\r'.
 * Usage: mmap_read_text(path, out, msg); returns false with msg on failure.
 */
#include <string>
#include <vector>
#include <filesystem>

bool mmap_read_text(const std::filesystem::path& path,
                    std::u32string& out,
                    std::string& msg);

// Same source, split into '\n'-separated lines (CRs dropped). Used for rc files.
bool mmap_read_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::string& msg);
