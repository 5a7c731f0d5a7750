#include "file_io.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace lmenu::fileio {
namespace {
	void set_error(std::string* outError, std::string message) {
		if (outError) *outError = std::move(message);
	}
}

std::optional<std::string> readFile(const std::string& path) {
	std::error_code ec;
	auto size = std::filesystem::file_size(path, ec);
	if (ec || size > kMaxConfigBytes) return std::nullopt;
	std::ifstream ifs(path, std::ios::binary);
	if (!ifs) return std::nullopt;
	std::string bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
	if (ifs.bad()) return std::nullopt;
	return bytes;
}

bool writeFileAtomic(const std::string& path, std::string_view bytes, std::string* outError) {
	namespace fs = std::filesystem;
	fs::path target(path);
	fs::path dir = target.parent_path();
	if (!dir.empty()) {
		std::error_code ec;
		fs::create_directories(dir, ec);
	}
	// Unique temp name in the same directory so the rename stays on one filesystem
	fs::path tmp = target;
	tmp += ".tmp";
	tmp += std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
	{
		std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
		if (!ofs) {
			set_error(outError, "cannot open " + tmp.string() + " for writing");
			return false;
		}
		ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
		ofs.flush();
		if (!ofs) {
			ofs.close();
			std::error_code ec;
			fs::remove(tmp, ec);
			set_error(outError, "write to " + tmp.string() + " failed");
			return false;
		}
	}
	std::error_code ec;
	fs::rename(tmp, target, ec);
	if (ec) {
		set_error(outError, "rename to " + target.string() + " failed: " + ec.message());
		std::error_code ec2;
		fs::remove(tmp, ec2);
		return false;
	}
	return true;
}

bool exists(const std::string& path) {
	std::error_code ec;
	return std::filesystem::exists(path, ec) && !ec;
}

bool isDirectory(const std::string& path) {
	std::error_code ec;
	return std::filesystem::is_directory(path, ec) && !ec;
}
}
