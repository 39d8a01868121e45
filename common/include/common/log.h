#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

#include <string>

namespace common::log
{

enum class Level
{
    Info,
    Warning,
    Error
};

// One Qt category per pipeline area, named "axisbend.<area>" so filter rules can target them.
enum class Category
{
    Io,
    Gcode,
    Bend,
    Kin,
    Post,
    Pipeline,
    Remote
};

namespace detail
{

inline const QLoggingCategory& categoryHandle(Category category)
{
    static const QLoggingCategory io("axisbend.io");
    static const QLoggingCategory gcode("axisbend.gcode");
    static const QLoggingCategory bend("axisbend.bend");
    static const QLoggingCategory kin("axisbend.kin");
    static const QLoggingCategory post("axisbend.post");
    static const QLoggingCategory pipeline("axisbend.pipeline");
    static const QLoggingCategory remote("axisbend.remote");

    switch (category)
    {
    case Category::Io: return io;
    case Category::Gcode: return gcode;
    case Category::Bend: return bend;
    case Category::Kin: return kin;
    case Category::Post: return post;
    case Category::Remote: return remote;
    case Category::Pipeline: break;
    }
    return pipeline;
}

} // namespace detail

inline void write(Level level, Category category, const QString& message)
{
    const QLoggingCategory& qtCategory = detail::categoryHandle(category);
    switch (level)
    {
    case Level::Info:
        qCInfo(qtCategory).noquote() << message;
        break;
    case Level::Warning:
        qCWarning(qtCategory).noquote() << message;
        break;
    case Level::Error:
        qCCritical(qtCategory).noquote() << message;
        break;
    }
}

inline void write(Level level, Category category, const std::string& message)
{
    write(level, category, QString::fromStdString(message));
}

} // namespace common::log

#define AXISBEND_LOG(level, category, message)                                                      \
    ::common::log::write(::common::log::Level::level, ::common::log::Category::category, (message))

#define LOG_INFO(category, message) AXISBEND_LOG(Info, category, message)
#define LOG_WARN(category, message) AXISBEND_LOG(Warning, category, message)
#define LOG_ERR(category, message) AXISBEND_LOG(Error, category, message)
