// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_PRESENTER_CONSOLE_PRESENTER_HPP
#define NATIVE_SHARE_PRESENTER_CONSOLE_PRESENTER_HPP

#include <ostream>

#include "native_share/presenter/SharePresenter.hpp"

namespace native_share::presenter {

// Prints the share payload and completes immediately. Used by the CLI host.
class ConsolePresenter : public SharePresenter {
public:
    explicit ConsolePresenter(std::ostream& out);

    void present(const std::vector<ShareItem>& items,
                 const std::optional<std::string>& title,
                 PresentationCompletion completion) override;

private:
    std::ostream& out_;
};

}  // namespace native_share::presenter

#endif  // NATIVE_SHARE_PRESENTER_CONSOLE_PRESENTER_HPP
