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

/// \file
/// Implementation of the Bindery::DeviceObjectBase template class

#include <sstream>

#include "ObjectBase.hpp"
#include "UniqueIdentifier.hpp"
#include "DeviceObject.h"

namespace Bindery
{

/// Template class implementing base functionality for a device object

/// \tparam BaseInterface        - Base interface that this class will inherit (IBuffer, ITexture, ...).
/// \tparam RenderDeviceImplType - Type of the render device implementation.
/// \tparam ObjectDescType       - Type of the object description structure.
///
/// \remarks Device objects do not keep a strong reference to the device. The device
///          must outlive all objects it created.
template <class BaseInterface, typename RenderDeviceImplType, typename ObjectDescType>
class DeviceObjectBase : public ObjectBase<BaseInterface>
{
public:
    using TBase = ObjectBase<BaseInterface>;

    /// \param pDevice - Pointer to the render device.
    /// \param ObjDesc - Object description.
    DeviceObjectBase(RenderDeviceImplType* pDevice,
                     const ObjectDescType& ObjDesc) :
        // clang-format off
        m_pDevice       {pDevice},
        m_ObjectNameCopy{ObjDesc.Name != nullptr ? String{ObjDesc.Name} : ThisToString()},
        m_Desc          {ObjDesc}
    // clang-format on
    {
        m_Desc.Name = m_ObjectNameCopy.c_str();
    }

    // clang-format off
    DeviceObjectBase             (const DeviceObjectBase&)  = delete;
    DeviceObjectBase             (      DeviceObjectBase&&) = delete;
    DeviceObjectBase& operator = (const DeviceObjectBase&)  = delete;
    DeviceObjectBase& operator = (      DeviceObjectBase&&) = delete;
    // clang-format on

    IMPLEMENT_QUERY_INTERFACE_IN_PLACE(IID_DeviceObject, TBase)

    virtual const ObjectDescType& GetDesc() const override final
    {
        return m_Desc;
    }

    /// Returns unique identifier
    virtual Int32 GetUniqueID() const override final
    {
        /// \note
        /// This unique ID is used to unambiguously identify device object for
        /// tracking purposes. Pointers can't be used for this purpose as the
        /// memory of a released object is reused.
        return m_UniqueID.GetID();
    }

    RenderDeviceImplType* GetDevice() const { return m_pDevice; }

protected:
    /// Pointer to the device
    RenderDeviceImplType* const m_pDevice;

    /// Copy of a device object name.

    /// When new object is created, its description structure is copied
    /// to m_Desc, the name is copied to m_ObjectNameCopy, and
    /// m_Desc.Name pointer is set to m_ObjectNameCopy.c_str().
    const String m_ObjectNameCopy;

    /// Object description
    ObjectDescType m_Desc;

    // Template argument is only used to separate counters for
    // different groups of objects
    UniqueIdHelper<BaseInterface> m_UniqueID;

private:
    String ThisToString() const
    {
        std::stringstream ss;
        ss << this;
        return ss.str();
    }
};

} // namespace Bindery
