#pragma once

namespace c8vm {

// Defer macro by Arthur O'Dwyer:
// https://quuxplusone.github.io/blog/2018/08/11/the-auto-macro/
template <class L>
class AtScopeExit {
    L& m_lambda;

public:
    AtScopeExit(L& action) : m_lambda(action) {}
    ~AtScopeExit() { m_lambda(); }
};

} // namespace c8vm

#define C8VM_TOKEN_PASTEx(x, y) x##y
#define C8VM_TOKEN_PASTE(x, y) C8VM_TOKEN_PASTEx(x, y)

#define C8VM_Auto_INTERNAL1(lname, aname, ...)                                                \
    auto lname = [&]() { __VA_ARGS__; };                                                      \
    c8vm::AtScopeExit<decltype(lname)> aname(lname);

#define C8VM_Auto_INTERNAL2(ctr, ...)                                                         \
    C8VM_Auto_INTERNAL1(C8VM_TOKEN_PASTE(Auto_func_, ctr),                                    \
                        C8VM_TOKEN_PASTE(Auto_instance_, ctr), __VA_ARGS__)

#define C8VM_Defer(...) C8VM_Auto_INTERNAL2(__COUNTER__, __VA_ARGS__)
