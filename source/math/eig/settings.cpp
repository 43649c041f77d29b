#include "settings.h"
#include "io/fmt.h"

std::string eig::settings::to_string() const {
    /* clang-format off */
    std::string msg;
    if(lib)             msg.append(fmt::format(" | lib {}", enum2sv(lib.value())));
    if(form)            msg.append(fmt::format(" | form {}", enum2sv(form.value())));
    if(type)            msg.append(fmt::format(" | type {}", enum2sv(type.value())));
    if(compute_eigvecs) msg.append(fmt::format(" | eigvecs {}", compute_eigvecs.value() == Vecs::ON));
    if(loglevel)        msg.append(fmt::format(" | loglevel {}", loglevel.value()));
    if(not tag.empty()) msg.append(fmt::format(" | tag {}", tag));
    return msg.empty() ? msg : "eig settings" + msg;
    /* clang-format on */
}
