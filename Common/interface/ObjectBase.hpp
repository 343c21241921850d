/*
 *  Copyright 2024 Diligent Graphics LLC
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 *
 *  In no event and under no legal theory, whether in tort (including negligence),
 *  contract, or otherwise, unless required by applicable law (such as deliberate
 *  and grossly negligent acts) or agreed to in writing, shall any Contributor be
 *  liable for any damages, including any direct, indirect, special, incidental,
 *  or consequential damages of any character arising as a result of this License or
 *  out of the use or inability to use the software (including but not limited to damages
 *  for loss of goodwill, work stoppage, computer failure or malfunction, or any and
 *  all other commercial damages or losses), even if such Contributor has been advised
 *  of the possibility of such damages.
 */


#pragma once

#include <atomic>

#include "../../Primitives/interface/Object.h"
#include "../../Platforms/Basic/interface/DebugUtilities.hpp"

namespace Bindery
{

/// Base class for reference-counting objects.

/// The object is created with zero references and is destroyed when the last
/// strong reference is released.
template <typename BaseInterface>
class RefCountedObject : public BaseInterface
{
public:
    RefCountedObject() noexcept {}

    virtual ~RefCountedObject()
    {
        VERIFY(m_NumStrongRefs.load() == 0, "There remain ", m_NumStrongRefs.load(), " strong references to the object being destroyed");
    }

    virtual ReferenceCounterValueType AddRef() override
    {
        return ++m_NumStrongRefs;
    }

    virtual ReferenceCounterValueType Release() override
    {
        const auto RefCount = --m_NumStrongRefs;
        VERIFY(RefCount >= 0, "Inconsistent call to Release()");
        if (RefCount == 0)
        {
            delete this;
        }
        return RefCount;
    }

    ReferenceCounterValueType GetNumStrongRefs() const
    {
        return m_NumStrongRefs.load();
    }

    // clang-format off
    RefCountedObject             (const RefCountedObject&)  = delete;
    RefCountedObject             (      RefCountedObject&&) = delete;
    RefCountedObject& operator = (const RefCountedObject&)  = delete;
    RefCountedObject& operator = (      RefCountedObject&&) = delete;
    // clang-format on

private:
    std::atomic<ReferenceCounterValueType> m_NumStrongRefs{0};
};


#define IMPLEMENT_QUERY_INTERFACE_BODY(InterfaceID, ParentClassName) \
    {                                                                \
        if (ppInterface == nullptr)                                  \
            return;                                                  \
        if (IID == InterfaceID)                                      \
        {                                                            \
            *ppInterface = this;                                     \
            (*ppInterface)->AddRef();                                \
        }                                                            \
        else                                                         \
        {                                                            \
            ParentClassName::QueryInterface(IID, ppInterface);       \
        }                                                            \
    }

#define IMPLEMENT_QUERY_INTERFACE_IN_PLACE(InterfaceID, ParentClassName)              \
    virtual void QueryInterface(const INTERFACE_ID& IID, IObject** ppInterface) override \
        IMPLEMENT_QUERY_INTERFACE_BODY(InterfaceID, ParentClassName)

#define IMPLEMENT_QUERY_INTERFACE(ClassName, InterfaceID, ParentClassName)    \
    void ClassName::QueryInterface(const INTERFACE_ID& IID, IObject** ppInterface) \
        IMPLEMENT_QUERY_INTERFACE_BODY(InterfaceID, ParentClassName)


/// Base implementation of a reference-counted object that exposes IID_Unknown
template <typename BaseInterface>
class ObjectBase : public RefCountedObject<BaseInterface>
{
public:
    virtual void QueryInterface(const INTERFACE_ID& IID, IObject** ppInterface) override
    {
        if (ppInterface == nullptr)
            return;

        *ppInterface = nullptr;
        if (IID == IID_Unknown)
        {
            *ppInterface = this;
            (*ppInterface)->AddRef();
        }
    }
};

} // namespace Bindery
