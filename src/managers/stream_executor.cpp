#include "stream_executor.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

OutputStream::OutputStream(std::unique_ptr<RemoteProcess> process, std::chrono::milliseconds poll)
    : process_(std::move(process)), poll_(poll), finished_(process_ == nullptr) {
}

OutputStream::~OutputStream() {
    finish();
}

OutputStream::OutputStream(OutputStream&& other) noexcept
    : process_(std::move(other.process_)), poll_(other.poll_), cancel_(other.cancel_),
      finished_(other.finished_), exit_status_(other.exit_status_),
      on_finish_(std::move(other.on_finish_)) {
    other.finished_ = true;
    other.on_finish_ = nullptr;
    other.cancel_ = nullptr;
}

OutputStream& OutputStream::operator=(OutputStream&& other) noexcept {
    if (this != &other) {
        finish();
        process_ = std::move(other.process_);
        poll_ = other.poll_;
        cancel_ = other.cancel_;
        finished_ = other.finished_;
        exit_status_ = other.exit_status_;
        on_finish_ = std::move(other.on_finish_);
        other.finished_ = true;
        other.on_finish_ = nullptr;
        other.cancel_ = nullptr;
    }
    return *this;
}

void OutputStream::finish() {
    finished_ = true;
    if (process_) {
        process_->close();
        process_.reset();
    }
    if (on_finish_) {
        auto fn = std::move(on_finish_);
        on_finish_ = nullptr;
        fn();
    }
}

void OutputStream::close() {
    if (!finished_) {
        brickdev_log("stream: closed by consumer");
    }
    finish();
}

StreamEvent OutputStream::next() {
    if (finished_) return StreamEvent::end();

    while (true) {
        if (cancelled()) {
            brickdev_log("stream: cancelled");
            finish();
            return StreamEvent::end();
        }

        LineRead r = process_->read_line(poll_);
        switch (r.status) {
            case LineRead::Status::Line:
                return StreamEvent::line(std::move(r.line));

            case LineRead::Status::Timeout:
                if (auto code = process_->exit_status()) {
                    exit_status_ = code;
                    finish();
                    return StreamEvent::end();
                }
                break;

            case LineRead::Status::Eof:
                if (auto code = process_->exit_status()) {
                    exit_status_ = code;
                    finish();
                    return StreamEvent::end();
                }
                // Stream drained but the exit status has not arrived yet
                platform::sleep_ms(static_cast<int>(poll_.count()));
                break;

            case LineRead::Status::Error:
                brickdev_log(fmt::format("stream: {}: {}",
                                         error_kind_name(ErrorKind::StreamRead), r.error));
                finish();
                return StreamEvent::error(r.error);
        }
    }
}

Result<int> OutputStream::drain(const std::function<bool(const std::string&)>& on_line) {
    while (true) {
        StreamEvent ev = next();
        if (ev.kind == StreamEvent::Kind::Line) {
            if (on_line && !on_line(ev.text)) {
                close();
                break;
            }
            continue;
        }
        if (ev.kind == StreamEvent::Kind::Error) {
            return Result<int>::Err(ErrorKind::StreamRead, ev.text);
        }
        break;
    }
    // -1 when stopped before the process reported its exit
    return Result<int>::Ok(exit_status_.value_or(-1));
}

StreamingExecutor::StreamingExecutor(std::chrono::milliseconds poll_interval)
    : poll_(poll_interval) {
}

Result<OutputStream> StreamingExecutor::run(TransportHandle& handle, const std::string& command) {
    auto spawned = handle.spawn(command);
    if (spawned.is_err()) {
        brickdev_log(fmt::format("exec: spawn on {} failed: {}", handle.address(), spawned.error));
        return Result<OutputStream>::Err(ErrorKind::ProcessSpawn, spawned.error);
    }
    brickdev_log(fmt::format("exec: {} on {}", command, handle.address()));
    return Result<OutputStream>::Ok(OutputStream(std::move(spawned.value), poll_));
}
