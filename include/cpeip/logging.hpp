#pragma once

#include <sstream>
#include <string>

namespace cpeip::log {

/// ログの重要度
enum class Level {
    Debug,    // 詳細なデバッグ情報（チャンク単位の転送など）
    Verbose,  // 動作の経過情報
    Info,     // 通常の情報（接続、セッション登録など）
    Error     // エラー
};

/// ロガーを初期化する
/// @param id syslogの識別子
/// @param syslog_facility syslogファシリティ（例: "LOCAL0"）。空の場合は標準出力へ出力
/// @param level 出力する最低レベル
void init(const std::string& id, const std::string& syslog_facility, Level level);

Level level();
void setLevel(Level level);

/// 組み立て済みのメッセージを出力する
void write(Level level, std::ostringstream& msg);

template<typename T, typename... Args>
void write(Level level, std::ostringstream& msg, const T& value, const Args&... args) {
    msg << value;
    write(level, msg, args...);
}

template<typename... Args>
void write(Level level, const Args&... args) {
    if (level < cpeip::log::level()) {
        return;
    }
    std::ostringstream msg;
    write(level, msg, args...);
}

} // namespace cpeip::log

#define CPEIP_LOG_DEBUG(...)   ::cpeip::log::write(::cpeip::log::Level::Debug, __VA_ARGS__)
#define CPEIP_LOG_VERBOSE(...) ::cpeip::log::write(::cpeip::log::Level::Verbose, __VA_ARGS__)
#define CPEIP_LOG_INFO(...)    ::cpeip::log::write(::cpeip::log::Level::Info, __VA_ARGS__)
#define CPEIP_LOG_ERROR(...)   ::cpeip::log::write(::cpeip::log::Level::Error, __VA_ARGS__)
