#include "gbasave/common/Logging.h"

#include "gbasave/common/Logger.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMessageLogContext>
#include <QtGlobal>

#include <fstream>
#include <iostream>
#include <memory>
#include <streambuf>
#include <string>

namespace {

using GBASave::Common::LogEntry;
using GBASave::Common::Logger;
using GBASave::Common::LogLevel;
using GBASave::Common::LogLevelName;

// Everything the file sink owns between Init and Shutdown.
struct SinkState {
  std::ofstream file;
  bool mirror = false;
  std::streambuf *coutBuf = nullptr;
  std::streambuf *cerrBuf = nullptr;
  std::unique_ptr<std::streambuf> coutCapture;
  std::unique_ptr<std::streambuf> cerrCapture;
};

std::unique_ptr<SinkState> g_sink;

// Set while the sink itself is writing, so captured streams cannot loop
// back into the logger.
thread_local bool g_writing = false;

LogLevel LevelFromEnv() {
  const QString v =
      qEnvironmentVariable("GBASAVE_LOG_LEVEL").trimmed().toLower();
  if (v == "debug")
    return LogLevel::Debug;
  if (v == "warn" || v == "warning")
    return LogLevel::Warning;
  if (v == "error")
    return LogLevel::Error;
  if (v == "fatal")
    return LogLevel::Fatal;
  return LogLevel::Info;
}

// 2026-10-19T14:03:12.123 [WARN] [SectorStore] sector 7 checksum mismatch
std::string FormatLine(const LogEntry &e) {
  const QDateTime when =
      QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(e.timestamp));
  return QString("%1 [%2] [%3] %4")
      .arg(when.toString(Qt::ISODateWithMs))
      .arg(QString::fromLatin1(LogLevelName(e.level)))
      .arg(QString::fromStdString(e.category))
      .arg(QString::fromStdString(e.message))
      .toStdString();
}

void WriteEntry(const LogEntry &e) {
  if (!g_sink)
    return;
  const std::string line = FormatLine(e);
  g_writing = true;
  if (g_sink->file.is_open()) {
    g_sink->file << line << '\n';
    g_sink->file.flush();
  }
  if (g_sink->mirror) {
    std::streambuf *target =
        e.level >= LogLevel::Error ? g_sink->cerrBuf : g_sink->coutBuf;
    if (target) {
      target->sputn(line.data(), static_cast<std::streamsize>(line.size()));
      target->sputc('\n');
      target->pubsync();
    }
  }
  g_writing = false;
}

// Turns whole lines written to std::cout / std::cerr into logger entries.
class StreamCapture final : public std::streambuf {
public:
  StreamCapture(std::streambuf *original, LogLevel level, const char *category)
      : m_original(original), m_level(level), m_category(category) {}

protected:
  int overflow(int ch) override {
    if (ch == traits_type::eof())
      return traits_type::not_eof(ch);
    if (ch == '\n')
      EmitLine();
    else
      m_pending.push_back(static_cast<char>(ch));
    return ch;
  }

  int sync() override {
    EmitLine();
    return 0;
  }

private:
  void EmitLine() {
    if (m_pending.empty())
      return;
    if (g_writing) {
      if (m_original) {
        m_original->sputn(m_pending.data(),
                          static_cast<std::streamsize>(m_pending.size()));
        m_original->sputc('\n');
      }
    } else {
      Logger::Instance().Log(m_level, m_category, m_pending);
    }
    m_pending.clear();
  }

  std::streambuf *m_original;
  LogLevel m_level;
  std::string m_category;
  std::string m_pending;
};

LogLevel FromQtType(QtMsgType type) {
  switch (type) {
  case QtDebugMsg:
    return LogLevel::Debug;
  case QtInfoMsg:
    return LogLevel::Info;
  case QtWarningMsg:
    return LogLevel::Warning;
  case QtCriticalMsg:
    return LogLevel::Error;
  case QtFatalMsg:
    return LogLevel::Fatal;
  }
  return LogLevel::Info;
}

void QtMessageToLogger(QtMsgType type, const QMessageLogContext &ctx,
                       const QString &msg) {
  QString text = msg;
  if (ctx.file && *ctx.file)
    text += QString(" (%1:%2)").arg(QString::fromUtf8(ctx.file)).arg(ctx.line);
  Logger::Instance().Log(FromQtType(type), "Qt", text.toStdString());
}

} // namespace

namespace GBASave::Common {

void InitAppLogging(const QString &logFilePath, bool mirrorToConsole) {
  if (g_sink)
    return;
  g_sink = std::make_unique<SinkState>();
  g_sink->mirror = mirrorToConsole ||
                   qEnvironmentVariableIntValue("GBASAVE_LOG_MIRROR") != 0;

  const QFileInfo info(logFilePath);
  if (!logFilePath.isEmpty() && !info.dir().exists())
    info.dir().mkpath(".");

  const bool append = qEnvironmentVariableIntValue("GBASAVE_LOG_APPEND") != 0;
  g_sink->file.open(logFilePath.toStdString(),
                    append ? std::ios::out | std::ios::app
                           : std::ios::out | std::ios::trunc);

  Logger &logger = Logger::Instance();
  logger.SetLevel(LevelFromEnv());
  logger.SetCallback(WriteEntry);
  qInstallMessageHandler(QtMessageToLogger);

  g_sink->coutBuf = std::cout.rdbuf();
  g_sink->cerrBuf = std::cerr.rdbuf();
  g_sink->coutCapture = std::make_unique<StreamCapture>(
      g_sink->coutBuf, LogLevel::Info, "STDOUT");
  g_sink->cerrCapture = std::make_unique<StreamCapture>(
      g_sink->cerrBuf, LogLevel::Error, "STDERR");
  std::cout.rdbuf(g_sink->coutCapture.get());
  std::cerr.rdbuf(g_sink->cerrCapture.get());

  const QString app = QCoreApplication::applicationName();
  logger.LogFmt(LogLevel::Info, "main", "%s %s logging to %s",
                app.isEmpty() ? "gbasave" : app.toStdString().c_str(),
                QCoreApplication::applicationVersion().toStdString().c_str(),
                logFilePath.toStdString().c_str());
  if (!g_sink->file.is_open())
    logger.LogFmt(LogLevel::Warning, "main", "cannot open log file %s",
                  logFilePath.toStdString().c_str());
}

void ShutdownAppLogging() {
  if (!g_sink)
    return;

  std::cout.rdbuf(g_sink->coutBuf);
  std::cerr.rdbuf(g_sink->cerrBuf);
  qInstallMessageHandler(nullptr);
  Logger::Instance().SetCallback(nullptr);

  if (g_sink->file.is_open())
    g_sink->file.close();
  g_sink.reset();
}

} // namespace GBASave::Common
