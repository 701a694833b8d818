#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace pnpc {
namespace gtest {

inline std::string dataPath(const std::string& name) {
	return (std::filesystem::path(PATH_TEST_DATA) / name).string();
}

//! Path in a per-process scratch directory under the system temp directory.
inline std::string tempPath(const std::string& name) {
	const auto dir = std::filesystem::temp_directory_path() / "pnpc_gtest";
	std::filesystem::create_directories(dir);
	return (dir / name).string();
}

//! Write 'content' byte for byte and return the path.
inline std::string writeTemp(const std::string& name, const std::string& content) {
	const std::string path = tempPath(name);
	std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
	out << content;
	return path;
}

inline std::string readFile(const std::string& path) {
	std::ifstream in(path, std::ios::in | std::ios::binary);
	std::stringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

} // namespace gtest
} // namespace pnpc
