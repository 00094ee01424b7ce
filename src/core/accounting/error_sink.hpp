#pragma once

#include "../../infra/error_handler/error.hpp"

namespace xferacct::core::accounting {

// Узкий интерфейс для подсчёта ошибок. Передаётся компонентам явно,
// вместо глобального хука.
class ErrorSink {
public:
    virtual ~ErrorSink() = default;

    virtual void record_error(infra::Error err) = 0;
};

} // namespace xferacct::core::accounting
