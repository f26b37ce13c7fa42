// CRCValidator.cpp - CRC-8 and CRC-16 validation for FLAC frames

#include "flacdec.h"

namespace FlacDec {
namespace FLAC {

namespace {

constexpr std::array<uint8_t, 256> makeCRC8Table()
{
    std::array<uint8_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 0x80) ? ((crc << 1) ^ 0x07) : (crc << 1);
        }
        table[i] = static_cast<uint8_t>(crc & 0xFF);
    }
    return table;
}

constexpr std::array<uint16_t, 256> makeCRC16Table()
{
    std::array<uint16_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t crc = i << 8;
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 0x8000) ? ((crc << 1) ^ 0x8005) : (crc << 1);
        }
        table[i] = static_cast<uint16_t>(crc & 0xFFFF);
    }
    return table;
}

} // anonymous namespace

// Built at compile time, read-only afterwards
const std::array<uint8_t, 256> CRCValidator::CRC8_TABLE = makeCRC8Table();
const std::array<uint16_t, 256> CRCValidator::CRC16_TABLE = makeCRC16Table();

CRCValidator::CRCValidator()
    : m_crc8(0)
    , m_crc16(0)
{
}

uint8_t CRCValidator::computeCRC8(const uint8_t* data, size_t length)
{
    uint8_t crc = 0;
    if (!data) return crc;
    for (size_t i = 0; i < length; i++) {
        crc = CRC8_TABLE[crc ^ data[i]];
    }
    return crc;
}

uint16_t CRCValidator::computeCRC16(const uint8_t* data, size_t length)
{
    uint16_t crc = 0;
    if (!data) return crc;
    for (size_t i = 0; i < length; i++) {
        crc = static_cast<uint16_t>((crc << 8) ^ CRC16_TABLE[(crc >> 8) ^ data[i]]);
    }
    return crc;
}

void CRCValidator::resetCRC8()
{
    m_crc8 = 0;
}

void CRCValidator::resetCRC16()
{
    m_crc16 = 0;
}

void CRCValidator::updateCRC8(uint8_t byte)
{
    m_crc8 = CRC8_TABLE[m_crc8 ^ byte];
}

void CRCValidator::updateCRC16(uint8_t byte)
{
    m_crc16 = static_cast<uint16_t>((m_crc16 << 8) ^ CRC16_TABLE[(m_crc16 >> 8) ^ byte]);
}

void CRCValidator::updateCRC8(const uint8_t* data, size_t length)
{
    if (!data) return;
    for (size_t i = 0; i < length; i++) {
        updateCRC8(data[i]);
    }
}

void CRCValidator::updateCRC16(const uint8_t* data, size_t length)
{
    if (!data) return;
    for (size_t i = 0; i < length; i++) {
        updateCRC16(data[i]);
    }
}

} // namespace FLAC
} // namespace FlacDec
