//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_REF_WRAPPER_HPP_INCLUDED
#define DPXFER_REF_WRAPPER_HPP_INCLUDED

namespace dpxfer
{

/// Owning-pointer friendly facade over a test-owned mock.
///
/// Production code receives (and eventually destroys) the wrapper, while the test keeps
/// expectations on the mock itself; destruction is reported as `deinit()`.
///
template <typename Interface, typename Reference>
struct RefWrapper : Interface
{
    explicit RefWrapper(Reference& reference)
        : reference_{reference}
    {
    }

    RefWrapper(const RefWrapper& other)          = delete;
    RefWrapper(RefWrapper&&) noexcept            = delete;
    RefWrapper& operator=(const RefWrapper&)     = delete;
    RefWrapper& operator=(RefWrapper&&) noexcept = delete;

    virtual ~RefWrapper()
    {
        reference_.deinit();
    }

    Reference& reference()
    {
        return reference_;
    }

private:
    Reference& reference_;

};  // RefWrapper

}  // namespace dpxfer

#endif  // DPXFER_REF_WRAPPER_HPP_INCLUDED
