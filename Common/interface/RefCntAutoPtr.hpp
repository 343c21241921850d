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

#include <utility>
#include <type_traits>

#include "../../Primitives/interface/Object.h"
#include "../../Platforms/Basic/interface/DebugUtilities.hpp"

namespace Bindery
{

// The main advantage of RefCntAutoPtr over the std::shared_ptr is that you can
// attach the same raw pointer to different smart pointers.
//
// For instance, the following code will crash since p will be released twice:
//
// auto *p = new char;
// std::shared_ptr<char> pTmp1(p);
// std::shared_ptr<char> pTmp2(p);
// ...

// This code, in contrast, works perfectly fine:
//
// IBuffer* pRawPtr = ...;
// RefCntAutoPtr<IBuffer> pSmartPtr1(pRawPtr);
// RefCntAutoPtr<IBuffer> pSmartPtr2(pRawPtr);
// ...

/// Template class that implements reference counting
template <typename T>
class RefCntAutoPtr
{
public:
    RefCntAutoPtr() noexcept {}

    explicit RefCntAutoPtr(T* pObj) noexcept :
        m_pObject{pObj}
    {
        if (m_pObject)
            m_pObject->AddRef();
    }

    RefCntAutoPtr(IObject* pObj, const INTERFACE_ID& IID) noexcept
    {
        if (pObj)
            pObj->QueryInterface(IID, reinterpret_cast<IObject**>(&m_pObject));
    }

    RefCntAutoPtr(const RefCntAutoPtr& AutoPtr) noexcept :
        m_pObject{AutoPtr.m_pObject}
    {
        if (m_pObject)
            m_pObject->AddRef();
    }

    template <typename DerivedType, typename = typename std::enable_if<std::is_convertible<DerivedType*, T*>::value>::type>
    RefCntAutoPtr(const RefCntAutoPtr<DerivedType>& AutoPtr) noexcept :
        RefCntAutoPtr<T>{AutoPtr.m_pObject}
    {
    }

    RefCntAutoPtr(RefCntAutoPtr&& AutoPtr) noexcept :
        m_pObject{AutoPtr.Detach()}
    {
    }

    ~RefCntAutoPtr()
    {
        Release();
    }

    void swap(RefCntAutoPtr& AutoPtr) noexcept
    {
        std::swap(m_pObject, AutoPtr.m_pObject);
    }

    /// Attaches the pointer without incrementing the reference counter
    void Attach(T* pObj) noexcept
    {
        Release();
        m_pObject = pObj;
    }

    /// Detaches the pointer without decrementing the reference counter
    T* Detach() noexcept
    {
        T* pObj   = m_pObject;
        m_pObject = nullptr;
        return pObj;
    }

    void Release() noexcept
    {
        if (m_pObject)
        {
            m_pObject->Release();
            m_pObject = nullptr;
        }
    }

    RefCntAutoPtr& operator=(T* pObj) noexcept
    {
        if (m_pObject != pObj)
        {
            if (m_pObject)
                m_pObject->Release();
            m_pObject = pObj;
            if (m_pObject)
                m_pObject->AddRef();
        }
        return *this;
    }

    RefCntAutoPtr& operator=(const RefCntAutoPtr& AutoPtr) noexcept
    {
        return *this = AutoPtr.m_pObject;
    }

    template <typename DerivedType, typename = typename std::enable_if<std::is_convertible<DerivedType*, T*>::value>::type>
    RefCntAutoPtr& operator=(const RefCntAutoPtr<DerivedType>& AutoPtr) noexcept
    {
        return *this = static_cast<T*>(AutoPtr.m_pObject);
    }

    RefCntAutoPtr& operator=(RefCntAutoPtr&& AutoPtr) noexcept
    {
        if (m_pObject != AutoPtr.m_pObject)
            Attach(AutoPtr.Detach());

        return *this;
    }

    // clang-format off
    bool operator!() const noexcept { return m_pObject == nullptr; }
    explicit operator bool() const noexcept { return m_pObject != nullptr; }

    bool operator==(const RefCntAutoPtr& Ptr) const noexcept { return m_pObject == Ptr.m_pObject; }
    bool operator!=(const RefCntAutoPtr& Ptr) const noexcept { return m_pObject != Ptr.m_pObject; }
    bool operator==(const T* pObj) const noexcept { return m_pObject == pObj; }
    bool operator!=(const T* pObj) const noexcept { return m_pObject != pObj; }

          T& operator*()       noexcept { return *m_pObject; }
    const T& operator*() const noexcept { return *m_pObject; }

          T* RawPtr()       noexcept { return m_pObject; }
    const T* RawPtr() const noexcept { return m_pObject; }

    template <typename DstType>
    DstType* RawPtr() noexcept { return static_cast<DstType*>(m_pObject); }

    operator       T*()       noexcept { return RawPtr(); }
    operator const T*() const noexcept { return RawPtr(); }

          T* operator->()       noexcept { return m_pObject; }
    const T* operator->() const noexcept { return m_pObject; }
    // clang-format on

private:
    // Note that the DoublePtrHelper is a private class, and can be created only by RefCntAutoPtr
    // Therefore if no one ever calls RefCntAutoPtr::operator&(), no helper will be created
    template <typename DstType>
    class DoublePtrHelper
    {
    public:
        DoublePtrHelper(RefCntAutoPtr& AutoPtr) noexcept :
            NewRawPtr{static_cast<DstType*>(AutoPtr)},
            m_pAutoPtr{std::addressof(AutoPtr)}
        {
        }

        DoublePtrHelper(DoublePtrHelper&& Helper) noexcept :
            NewRawPtr{Helper.NewRawPtr},
            m_pAutoPtr{Helper.m_pAutoPtr}
        {
            Helper.m_pAutoPtr = nullptr;
            Helper.NewRawPtr  = nullptr;
        }

        ~DoublePtrHelper()
        {
            if (m_pAutoPtr && *m_pAutoPtr != static_cast<T*>(NewRawPtr))
            {
                // The object has been written through the raw pointer and
                // already holds a reference that must not be added again
                m_pAutoPtr->Attach(static_cast<T*>(NewRawPtr));
            }
        }

        DstType*& operator*() noexcept { return NewRawPtr; }

        operator DstType**() noexcept { return &NewRawPtr; }

    private:
        DstType*       NewRawPtr;
        RefCntAutoPtr* m_pAutoPtr;

        DoublePtrHelper(const DoublePtrHelper&)            = delete;
        DoublePtrHelper& operator=(const DoublePtrHelper&) = delete;
        DoublePtrHelper& operator=(DoublePtrHelper&&)      = delete;
    };

public:
    DoublePtrHelper<T> operator&()
    {
        return DoublePtrHelper<T>(*this);
    }

    /// Returns the address of the internal pointer. The pointer must be empty.
    T** GetRawDblPtr() noexcept
    {
        VERIFY(m_pObject == nullptr, "Taking the address of a non-empty pointer leaks the current reference");
        return &m_pObject;
    }

private:
    template <typename OtherType>
    friend class RefCntAutoPtr;

    T* m_pObject = nullptr;
};

} // namespace Bindery
