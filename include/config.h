/**
 * @file config.h
 * @brief 全局配置常量 - 集中管理所有可调参数
 *
 * 配置分类：
 * - [固定] 系统常量
 * - [默认] 数据库中没有对应规则时使用的默认值 (工作规则 / 劳动法参数)
 *
 * 使用方法：
 *   #include "config.h"
 *   int planned = Config::WorkRule::DAILY_MINUTES_PLANNED;
 *   const char* tz = Config::Default::ATTENDANCE_TIMEZONE;
 */

#pragma once

namespace Config {

// ==================== 路径配置 [固定] ====================
namespace Path {
    constexpr const char* DATABASE = "./worktime.db";
#ifdef WORKTIME_ZONESPEC_FILE
    constexpr const char* ZONESPEC = WORKTIME_ZONESPEC_FILE;   // 构建时注入的时区库 (Boost zonespec CSV)
#else
    constexpr const char* ZONESPEC = "./data/date_time_zonespec.csv";
#endif
}

// ==================== 时区配置 ====================
namespace TimeZone {
    struct Alias {
        const char* name;        // 常用时区名
        const char* posix_spec;  // POSIX TZ 格式 (UTC 以东为负: UTC+3 写作 -3)
    };

    // 优先于时区库查找；时区库缺失或规则过时的区域放在这里
    constexpr Alias ALIASES[] = {
        {"Europe/Istanbul", "<+03>-3"},
        {"Asia/Istanbul",   "<+03>-3"},
        {"UTC",             "UTC0"},
        {"Etc/UTC",         "UTC0"},
    };
}

// ==================== 默认值 ====================
namespace Default {
    constexpr const char* ATTENDANCE_TIMEZONE = "Europe/Istanbul";  // 考勤本地时区
    constexpr const char* LABOR_PROFILE_NAME = "TR_DEFAULT";
}

// ==================== 部门工作规则默认值 [默认] ====================
namespace WorkRule {
    constexpr int DAILY_MINUTES_PLANNED = 540;     // 每日计划时长 (毛时长, 分钟)
    constexpr int BREAK_MINUTES = 60;              // 休息时长 (分钟)
    constexpr int GRACE_MINUTES = 5;               // 迟到宽限 (分钟)
}

// ==================== 劳动法参数默认值 [默认] ====================
namespace Labor {
    constexpr int WEEKLY_NORMAL_MINUTES = 45 * 60;        // 法定每周正常工时
    constexpr int DAILY_MAX_MINUTES = 11 * 60;            // 每日最长工时
    constexpr int NIGHT_WORK_MAX_MINUTES = 450;           // 夜班最长 7.5 小时
    constexpr int OVERTIME_ANNUAL_CAP_MINUTES = 270 * 60; // 年度加班上限 270 小时
    constexpr double OVERTIME_PREMIUM = 1.50;
    constexpr double EXTRA_WORK_PREMIUM = 1.25;
    constexpr bool ENFORCE_MIN_BREAK = false;
    constexpr bool NIGHT_WORK_EXCEPTIONS_NOTE_ENABLED = true;
}

} // namespace Config
