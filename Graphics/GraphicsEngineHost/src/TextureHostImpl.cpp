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


#include "TextureHostImpl.hpp"

#include <new>

#include "GraphicsAccessories.hpp"

namespace Bindery
{

TextureHostImpl::TextureHostImpl(RenderDeviceHostImpl* pDevice,
                                 const TextureDesc&    TexDesc) :
    TTextureBase{pDevice, TexDesc},
    m_DataSize{GetTextureDataSize(m_Desc)}
{
    if (m_DataSize > m_Data.max_size())
    {
        LOG_ERROR_AND_THROW("Texture '", (m_Desc.Name != nullptr ? m_Desc.Name : ""), "' requires ", m_DataSize,
                            " bytes, which exceeds the maximum host allocation size (", m_Data.max_size(), " bytes)");
    }

    m_pDevice->AllocateDeviceMemory(m_DataSize, m_Desc.Name);
    try
    {
        m_Data.resize(static_cast<size_t>(m_DataSize));
    }
    catch (...)
    {
        // Return the reservation before the error propagates
        m_pDevice->FreeDeviceMemory(m_DataSize);
        throw;
    }

    m_IsValid = true;
    m_pDevice->OnCreateTexture(this);
}

TextureHostImpl::~TextureHostImpl()
{
    if (m_IsValid)
        m_pDevice->FreeDeviceMemory(m_DataSize);
    m_pDevice->OnDestroyTexture(this);
}

void TextureHostImpl::Invalidate()
{
    if (!m_IsValid)
        return;

    m_IsValid = false;
    std::vector<Uint8>{}.swap(m_Data);
    m_pDevice->FreeDeviceMemory(m_DataSize);
}

} // namespace Bindery
