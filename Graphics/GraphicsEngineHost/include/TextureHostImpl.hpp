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
/// Declaration of Bindery::TextureHostImpl class

#include <vector>

#include "TextureHost.h"
#include "TextureBase.hpp"
#include "RenderDeviceHostImpl.hpp"

namespace Bindery
{

/// Texture object implementation in the host-memory backend.
class TextureHostImpl final : public TextureBase<ITextureHost, RenderDeviceHostImpl>
{
public:
    using TTextureBase = TextureBase<ITextureHost, RenderDeviceHostImpl>;

    TextureHostImpl(RenderDeviceHostImpl* pDevice,
                    const TextureDesc&    TexDesc);
    ~TextureHostImpl();

    IMPLEMENT_QUERY_INTERFACE_IN_PLACE(IID_TextureHost, TTextureBase)

    virtual bool IsValid() const override final { return m_IsValid; }

    virtual const void* GetData() const override final { return m_IsValid ? m_Data.data() : nullptr; }

    virtual Uint64 GetDataSize() const override final { return m_DataSize; }

    /// Releases the texture storage. The texture becomes invalid.
    void Invalidate();

private:
    const Uint64 m_DataSize;

    std::vector<Uint8> m_Data;

    bool m_IsValid = false;
};

} // namespace Bindery
