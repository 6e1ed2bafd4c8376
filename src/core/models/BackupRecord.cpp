#include "BackupRecord.hpp"

namespace {

std::string stringField(const Json::Value& value, const char* key) {
    const Json::Value& field = value[key];
    return field.isString() ? field.asString() : std::string();
}

uint64_t uintField(const Json::Value& value, const char* key) {
    const Json::Value& field = value[key];
    if (field.isUInt64()) {
        return field.asUInt64();
    }
    // 其他实现可能把整数写成浮点数
    if (field.isDouble() && field.asDouble() >= 0) {
        return static_cast<uint64_t>(field.asDouble());
    }
    return 0;
}

} // namespace

Json::Value BackupRecord::toJson() const {
    Json::Value value(Json::objectValue);
    value["arquivo"] = fileName;
    value["diretorio_origem"] = sourceDirectory;
    value["nome_diretorio"] = directoryName;
    value["data_criacao"] = createdAt;
    value["tamanho_original"] = Json::UInt64(originalSize);
    value["tamanho_backup"] = Json::UInt64(backupSize);
    value["taxa_compressao"] = compressionRatio;
    value["total_arquivos"] = Json::UInt64(totalFiles);
    value["arquivos_excluidos"] = Json::UInt64(excludedFiles);
    value["diretorios_excluidos"] = Json::UInt64(excludedDirs);
    value["tipo_diretorio"] = directoryType;
    value["hash_md5"] = hashMd5;
    value["compressao_maxima"] = maxCompression;
    value["formato"] = format;
    return value;
}

BackupRecord BackupRecord::fromJson(const Json::Value& value) {
    BackupRecord record;
    if (!value.isObject()) {
        return record;
    }
    record.fileName = stringField(value, "arquivo");
    record.sourceDirectory = stringField(value, "diretorio_origem");
    record.directoryName = stringField(value, "nome_diretorio");
    record.createdAt = stringField(value, "data_criacao");
    record.originalSize = uintField(value, "tamanho_original");
    record.backupSize = uintField(value, "tamanho_backup");
    record.compressionRatio = value["taxa_compressao"].isNumeric() ? value["taxa_compressao"].asDouble() : 0.0;
    record.totalFiles = uintField(value, "total_arquivos");
    record.excludedFiles = uintField(value, "arquivos_excluidos");
    record.excludedDirs = uintField(value, "diretorios_excluidos");
    record.directoryType = stringField(value, "tipo_diretorio");
    record.hashMd5 = stringField(value, "hash_md5");
    record.maxCompression = value["compressao_maxima"].isBool() && value["compressao_maxima"].asBool();
    record.format = stringField(value, "formato");
    return record;
}

bool BackupRecord::operator==(const BackupRecord& other) const {
    return fileName == other.fileName &&
           sourceDirectory == other.sourceDirectory &&
           directoryName == other.directoryName &&
           createdAt == other.createdAt &&
           originalSize == other.originalSize &&
           backupSize == other.backupSize &&
           compressionRatio == other.compressionRatio &&
           totalFiles == other.totalFiles &&
           excludedFiles == other.excludedFiles &&
           excludedDirs == other.excludedDirs &&
           directoryType == other.directoryType &&
           hashMd5 == other.hashMd5 &&
           maxCompression == other.maxCompression &&
           format == other.format;
}
