#pragma once

// Which halves of a tls_stream are still open. Transitions only move forward.
class connection_state{
public:
    enum class kind{
        early_data,
        open,
        read_shutdown,
        write_shutdown,
        fully_shutdown
    };

    connection_state() noexcept = default;
    explicit connection_state(kind k) noexcept;

    bool readable() const noexcept;
    bool writable() const noexcept;
    bool is_early_data() const noexcept;
    kind get() const noexcept;

    void shutdown_read() noexcept;
    void shutdown_write() noexcept;
    void finish_early_data() noexcept;

    friend bool operator==(const connection_state&, const connection_state&) = default;
private:
    kind current = kind::open;
};

const char* to_string(connection_state::kind k) noexcept;
