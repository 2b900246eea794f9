#pragma once

namespace duplex {
    class init {
    public:
        init();

        init(const init&) = delete;

        init(init&&) = delete;

        ~init();

        auto operator=(const init&) -> init& = delete;

        auto operator=(init&&) -> init& = delete;
    };
}
