#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace seocrawler {
namespace log {

	enum class Level { Debug = 0, Info, Warn, Error };

	void setLevel(Level level);
	Level level();

	//"debug", "info", "warn", "error"; anything else keeps Info
	Level parseLevel(const std::string& name);

	void write(Level level, const std::string& line);

	template<typename... Args>
	void emit(Level lvl, Args&&... args) {
		if (lvl < level())
			return;
		std::ostringstream oss;
		(oss << ... << args);
		write(lvl, oss.str());
	}

	template<typename... Args>
	void debug(Args&&... args) { emit(Level::Debug, std::forward<Args>(args)...); }

	template<typename... Args>
	void info(Args&&... args) { emit(Level::Info, std::forward<Args>(args)...); }

	template<typename... Args>
	void warn(Args&&... args) { emit(Level::Warn, std::forward<Args>(args)...); }

	template<typename... Args>
	void error(Args&&... args) { emit(Level::Error, std::forward<Args>(args)...); }

}
}
