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
/// Implementation of the Bindery::RenderDeviceBase template class and related structures

#include <new>
#include <stdexcept>

#include "RenderDevice.h"
#include "ObjectBase.hpp"
#include "GraphicsAccessories.hpp"

namespace Bindery
{

template <typename ObjectDescType>
String GetObjectDescString(const ObjectDescType&)
{
    return "";
}

template <>
inline String GetObjectDescString(const BufferDesc& BuffDesc)
{
    return FormatString("Buffer desc: ", GetBufferDescString(BuffDesc));
}

template <>
inline String GetObjectDescString(const TextureDesc& TexDesc)
{
    return FormatString("Texture desc: ", GetTextureDescString(TexDesc));
}


/// Base implementation of a render device

/// \tparam BaseInterface - Base interface that this class will inherit (IRenderDevice or IRenderDeviceHost).
template <typename BaseInterface>
class RenderDeviceBase : public ObjectBase<BaseInterface>
{
public:
    using TObjectBase = ObjectBase<BaseInterface>;

    RenderDeviceBase() noexcept {}

    IMPLEMENT_QUERY_INTERFACE_IN_PLACE(IID_RenderDevice, TObjectBase)

protected:
    /// Helper template function to facilitate device object creation

    /// \tparam TObjectType        - The type of the object being created (IBuffer, ITexture, etc.).
    /// \tparam TObjectDescType    - The type of the object description structure (BufferDesc, TextureDesc, etc.).
    /// \tparam TObjectConstructor - The type of the function that constructs the object.
    ///
    /// \param ObjectTypeName  - String name of the object type ("buffer", "texture", etc.).
    /// \param Desc            - Object description.
    /// \param ppObject        - Memory address where the pointer to the created object will be stored.
    /// \param ConstructObject - Function that constructs the object.
    ///
    /// \remarks Errors raised while the object is constructed are logged and
    ///          null is written to ppObject.
    template <typename TObjectType, typename TObjectDescType, typename TObjectConstructor>
    void CreateDeviceObject(const Char*            ObjectTypeName,
                            const TObjectDescType& Desc,
                            TObjectType**          ppObject,
                            TObjectConstructor     ConstructObject)
    {
        DEV_CHECK_ERR(ppObject != nullptr, "Null pointer provided");
        if (ppObject == nullptr)
            return;

        DEV_CHECK_ERR(*ppObject == nullptr, "Overwriting reference to existing object may cause memory leaks");

        *ppObject = nullptr;

        const Char* ErrorMessage = nullptr;
        try
        {
            ConstructObject();
        }
        catch (const std::bad_alloc&)
        {
            ErrorMessage = "out of host memory";
        }
        catch (const std::runtime_error&)
        {
            // The error has already been logged by the code that threw the exception
            ErrorMessage = "";
        }

        if (ErrorMessage != nullptr)
        {
            VERIFY(*ppObject == nullptr, "Object was created despite error");
            if (*ppObject != nullptr)
            {
                (*ppObject)->Release();
                *ppObject = nullptr;
            }

            const auto ObjectDescString = GetObjectDescString(Desc);
            LOG_ERROR("Failed to create ", ObjectTypeName, " object '", (Desc.Name != nullptr ? Desc.Name : ""), "'",
                      (*ErrorMessage != '\0' ? ": " : ""), ErrorMessage,
                      (!ObjectDescString.empty() ? "\n" : ""), ObjectDescString);
        }
    }
};

} // namespace Bindery
