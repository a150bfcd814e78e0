#ifndef WOLGATE_UTILS_HPP
#define WOLGATE_UTILS_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

template <typename F>
class Finally {
  private:
    F fin_;

  public:
    explicit Finally(F&& fin) : fin_(std::forward<F>(fin)) {}

    ~Finally() {
        fin_();
    }

    Finally(const Finally&) = delete;
    Finally(Finally&&) = delete;
    Finally& operator=(const Finally&) = delete;
    Finally& operator=(Finally&&) = delete;
};

template <typename F>
Finally<F> finally(F&& fin) {
    return Finally<F>(std::forward<F>(fin));
}

std::string_view trim(std::string_view s) noexcept;

// Splits on every occurrence of c. An empty input yields one empty field.
std::vector<std::string_view> split_all(std::string_view s, char c);

// Printable ASCII is kept. Quotes, backslashes and control bytes are escaped,
// so the result is safe to put on a single log line.
std::string escape(std::string_view s);

#endif
